/**
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <expected>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <cstddef>
#include <cstdint>

#include <sigc++/sigc++.h>

#include "batchrename/error.hxx"
#include "batchrename/validator.hxx"

namespace batchrename
{
struct apply_error final
{
    std::error_code kind;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
};

struct apply_result final
{
    std::filesystem::path original_path;
    std::filesystem::path new_path;
    std::uint64_t index;
    std::expected<void, apply_error> outcome;

    [[nodiscard]] bool
    success() const noexcept
    {
        return this->outcome.has_value();
    }
};

struct apply_progress final
{
    std::size_t completed;
    std::size_t total;

    [[nodiscard]] double
    fraction() const noexcept
    {
        if (this->total == 0)
        {
            return 1.0;
        }
        return static_cast<double>(this->completed) / static_cast<double>(this->total);
    }
};

enum class apply_status : std::uint8_t
{
    success, // every file renamed
    partial, // some files renamed
    error,   // no file renamed
};

struct apply_summary final
{
    std::size_t total{0};
    std::size_t succeeded{0};
    std::size_t failed{0};
    std::map<error_code, std::size_t> errors;
    std::vector<apply_result> results; // completion order

    [[nodiscard]] apply_status status() const noexcept;
    [[nodiscard]] std::string message() const noexcept;
};

/**
 * Results sorted back into batch order.
 */
[[nodiscard]] std::vector<apply_result>
sorted_by_index(const std::span<const apply_result> results) noexcept;

struct apply_options final
{
    // run plans with invalid names or existing files in the way,
    // plans with duplicate names are always refused
    bool override_conflicts{false};
    // worker threads, 1 keeps results in plan order
    std::uint32_t jobs{1};
};

class apply_engine final
{
  public:
    explicit apply_engine(const apply_options& options = {}) noexcept;
    ~apply_engine() noexcept;
    apply_engine(const apply_engine& other) = delete;
    apply_engine(apply_engine&& other) = delete;
    apply_engine& operator=(const apply_engine& other) = delete;
    apply_engine& operator=(apply_engine&& other) = delete;

    /**
     * @return error_code::none if the plan may be applied with the current options,
     * otherwise the kind of conflict that blocks it.
     */
    [[nodiscard]] std::error_code gate(const rename_plan& plan) const noexcept;

    /**
     * @brief run
     *
     * - Apply the plan on the calling thread. Every item is attempted and gets
     *   exactly one result, a failed item never stops the others.
     *   Stopping the token skips items that have not started yet.
     *
     * @return The summary of the run, or the gate() error if the plan was refused.
     */
    [[nodiscard]] std::expected<apply_summary, std::error_code>
    run(const rename_plan& plan, const std::stop_token& stoken = {}) noexcept;

    /**
     * Apply the plan on a background thread, signals are emitted from that thread.
     */
    [[nodiscard]] std::error_code start(rename_plan plan) noexcept;
    void cancel() noexcept;
    /**
     * Block until the background run started by start() finishes.
     */
    [[nodiscard]] std::optional<apply_summary> wait() noexcept;
    [[nodiscard]] bool running() const noexcept;

    // slots run on the worker that finished the item, one at a time,
    // a slow slot holds back the other workers
    [[nodiscard]] auto
    signal_result() noexcept
    {
        return this->signal_result_;
    }

    [[nodiscard]] auto
    signal_progress() noexcept
    {
        return this->signal_progress_;
    }

    [[nodiscard]] auto
    signal_finished() noexcept
    {
        return this->signal_finished_;
    }

  private:
    apply_options options_;

    std::mutex mutex_;
    std::optional<apply_summary> last_summary_{std::nullopt};
    std::atomic<bool> running_{false};

    sigc::signal<void(const apply_result&)> signal_result_;
    sigc::signal<void(apply_progress)> signal_progress_;
    sigc::signal<void(const apply_summary&)> signal_finished_;

    // last, joined before anything it uses is destroyed
    std::jthread thread_;
};
} // namespace batchrename
