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

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <expected>
#include <filesystem>
#include <format>
#include <functional>
#include <mutex>
#include <optional>
#include <ranges>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>

#include <fcntl.h>
#include <pthread.h>

#include <sigc++/sigc++.h>

#include "batchrename/apply-engine.hxx"
#include "batchrename/error.hxx"
#include "batchrename/path-utils.hxx"
#include "batchrename/validator.hxx"

#include "logger.hxx"

namespace
{
using move_result = std::expected<void, batchrename::apply_error>;

std::unexpected<batchrename::apply_error>
failure(const std::error_code& kind, const std::string_view message) noexcept
{
    return std::unexpected(batchrename::apply_error{
        .kind = batchrename::classify(kind),
        .message = std::string(message),
        .timestamp = std::chrono::system_clock::now(),
    });
}

bool
exists_no_follow(const std::filesystem::path& path) noexcept
{
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
}

bool
same_file(const std::filesystem::path& a, const std::filesystem::path& b) noexcept
{
    std::error_code ec;
    const bool equivalent = std::filesystem::equivalent(a, b, ec);
    return !ec && equivalent;
}

move_result
move_across_devices(const std::filesystem::path& from, const std::filesystem::path& to) noexcept
{
    const auto ec = batchrename::utils::move_by_copy(from, to);
    if (ec == batchrename::error_code::filesystem_other)
    {
        return failure(ec,
                       std::format("'{}' was only partly removed, copy kept at '{}'",
                                   from.string(),
                                   to.string()));
    }
    if (ec)
    {
        return failure(ec,
                       std::format("failed to move '{}' to '{}': {}",
                                   from.string(),
                                   to.string(),
                                   ec.message()));
    }
    return {};
}

/**
 * Move a single file or directory, never replaces an existing file.
 */
move_result
move_file(const std::filesystem::path& from, const std::filesystem::path& to) noexcept
{
    try
    {
        if (!exists_no_follow(from))
        {
            return failure(batchrename::error_code::source_missing,
                           std::format("'{}' no longer exists", from.string()));
        }

        if (batchrename::utils::path_key(from) == batchrename::utils::path_key(to))
        {
            return {};
        }

        std::error_code ec;

        if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0)
        {
            return {};
        }
        auto err = errno;

        if (err == EINVAL || err == ENOSYS)
        {
            // filesystem without RENAME_NOREPLACE
            if (exists_no_follow(to) && !same_file(from, to))
            {
                return failure(batchrename::error_code::existing_file_conflict,
                               std::format("'{}' already exists", to.string()));
            }

            std::filesystem::rename(from, to, ec);
            if (!ec)
            {
                return {};
            }
            err = ec.value();
        }

        if (err == EEXIST)
        {
            if (!same_file(from, to))
            {
                return failure(batchrename::error_code::existing_file_conflict,
                               std::format("'{}' already exists", to.string()));
            }

            // case only rename on a case insensitive filesystem
            std::filesystem::rename(from, to, ec);
            if (ec)
            {
                return failure(ec,
                               std::format("failed to rename '{}': {}",
                                           from.string(),
                                           ec.message()));
            }
            return {};
        }

        if (err == EXDEV)
        {
            if (exists_no_follow(to))
            {
                return failure(batchrename::error_code::existing_file_conflict,
                               std::format("'{}' already exists", to.string()));
            }
            return move_across_devices(from, to);
        }

        ec = std::error_code(err, std::system_category());
        return failure(ec,
                       std::format("failed to rename '{}' to '{}': {}",
                                   from.string(),
                                   to.string(),
                                   ec.message()));
    }
    catch (const std::exception& e)
    {
        return failure(batchrename::error_code::filesystem_other, e.what());
    }
}

struct step final
{
    std::size_t item; // index into the plan
    std::filesystem::path from;
    std::filesystem::path to;
    bool reports{true}; // false for a file parked on a temporary name
};

/**
 * Steps that depend on each other and must run in order.
 *
 * A chain moves a file only after the file sitting on its new name has moved.
 * A cycle parks its first file on a temporary name, cancelling is only possible
 * before the file is parked.
 */
struct unit final
{
    std::vector<step> steps;
    bool cycle{false};
};

std::vector<unit>
schedule(const std::span<const batchrename::plan_item> items) noexcept
{
    const auto count = items.size();

    std::unordered_map<std::string, std::size_t> source_of;
    for (std::size_t i = 0; i < count; ++i)
    {
        source_of.insert({batchrename::utils::path_key(items[i].original_path), i});
    }

    // blocker[i] : the file sitting on the new name of i
    // dependent[j] : the file waiting for j to move
    std::vector<std::optional<std::size_t>> blocker(count);
    std::vector<std::optional<std::size_t>> dependent(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        const auto target = batchrename::utils::path_key(items[i].new_path);
        if (target == batchrename::utils::path_key(items[i].original_path))
        {
            continue;
        }

        const auto it = source_of.find(target);
        if (it == source_of.cend() || dependent[it->second])
        {
            continue;
        }
        blocker[i] = it->second;
        dependent[it->second] = i;
    }

    std::vector<unit> units;
    std::vector<bool> scheduled(count, false);

    for (std::size_t i = 0; i < count; ++i)
    {
        if (scheduled[i] || blocker[i])
        {
            continue;
        }

        unit chain;
        for (std::optional<std::size_t> k = i; k; k = dependent[k.value()])
        {
            const auto& item = items[k.value()];
            chain.steps.push_back({k.value(), item.original_path, item.new_path});
            scheduled[k.value()] = true;
        }
        units.push_back(std::move(chain));
    }

    for (std::size_t i = 0; i < count; ++i)
    {
        if (scheduled[i])
        {
            continue;
        }

        // walk the ring, a file only has a single dependent so every
        // remaining file with a dependent is part of exactly one ring
        std::vector<std::size_t> ring{i};
        for (auto k = dependent[i]; k && k.value() != i; k = dependent[k.value()])
        {
            if (scheduled[k.value()] || std::ranges::contains(ring, k.value()))
            {
                ring.clear();
                break;
            }
            ring.push_back(k.value());
        }

        if (ring.size() < 2 || dependent[ring.back()] != i)
        {
            // not a ring, run on its own and let the filesystem report it
            unit single;
            single.steps.push_back({i, items[i].original_path, items[i].new_path});
            units.push_back(std::move(single));
            scheduled[i] = true;
            continue;
        }

        const auto& first = items[ring.front()];
        const auto parked = batchrename::utils::unique_path(
            first.original_path.parent_path(),
            std::format(".{}.batchrename", first.original_path.filename().string()),
            "-");

        unit cycle{.steps = {}, .cycle = true};
        cycle.steps.push_back({ring.front(), first.original_path, parked, false});
        for (const auto k : ring | std::views::drop(1))
        {
            cycle.steps.push_back({k, items[k].original_path, items[k].new_path});
        }
        cycle.steps.push_back({ring.front(), parked, first.new_path});

        for (const auto k : ring)
        {
            scheduled[k] = true;
        }
        units.push_back(std::move(cycle));
    }

    return units;
}

using report_function = std::function<void(std::size_t, move_result&&)>;

void
skip_remaining(const unit& work, const std::size_t from, const batchrename::error_code kind,
               const std::string_view reason, const report_function& report) noexcept
{
    for (std::size_t s = from; s < work.steps.size(); ++s)
    {
        const auto& current = work.steps[s];
        if (current.reports)
        {
            report(current.item, failure(kind, reason));
        }
    }
}

void
run_chain(const unit& work, const std::stop_token& stoken, const report_function& report) noexcept
{
    for (std::size_t s = 0; s < work.steps.size(); ++s)
    {
        const auto& current = work.steps[s];

        if (stoken.stop_requested())
        {
            skip_remaining(work, s, batchrename::error_code::cancelled, "cancelled", report);
            return;
        }

        auto result = move_file(current.from, current.to);
        if (!result)
        {
            logger::error<logger::domain::apply>("{} -> {}: {}",
                                                 current.from.string(),
                                                 current.to.string(),
                                                 result.error().message);
            report(current.item, std::move(result));
            skip_remaining(work,
                           s + 1,
                           batchrename::error_code::blocked,
                           std::format("blocked by '{}'", current.from.string()),
                           report);
            return;
        }
        report(current.item, std::move(result));
    }
}

/**
 * A cycle is either fully applied or fully undone, results are reported
 * once the outcome of every member is known.
 */
void
run_cycle(const unit& work, const std::stop_token& stoken, const report_function& report) noexcept
{
    if (stoken.stop_requested())
    {
        skip_remaining(work, 0, batchrename::error_code::cancelled, "cancelled", report);
        return;
    }

    const auto& park = work.steps.front();
    const auto last = work.steps.size() - 1;

    std::vector<move_result> outcomes;
    outcomes.reserve(work.steps.size());

    std::size_t failed = 0;
    for (std::size_t s = 0; s < work.steps.size(); ++s)
    {
        const auto& current = work.steps[s];
        outcomes.push_back(move_file(current.from, current.to));
        if (!outcomes.back())
        {
            failed = s;
            logger::error<logger::domain::apply>("{} -> {}: {}",
                                                 current.from.string(),
                                                 current.to.string(),
                                                 outcomes.back().error().message);
            break;
        }
    }

    if (outcomes.size() == work.steps.size() && outcomes.back())
    {
        for (std::size_t s = 1; s < work.steps.size(); ++s)
        {
            report(work.steps[s].item, std::move(outcomes[s]));
        }
        return;
    }

    const auto blocked = [&work, failed]
    {
        return failure(batchrename::error_code::blocked,
                       std::format("blocked by '{}'", work.steps[failed].from.string()));
    };

    if (failed == 0)
    {
        // parking failed, nothing in the cycle has moved
        report(park.item, std::move(outcomes.front()));
        for (std::size_t s = 1; s < last; ++s)
        {
            report(work.steps[s].item, blocked());
        }
        return;
    }

    // undo in reverse, each undo frees the name the one before it needs
    std::size_t undone = failed;
    for (std::size_t s = failed; s-- > 1;)
    {
        const auto& current = work.steps[s];
        const auto restored = move_file(current.to, current.from);
        if (!restored)
        {
            logger::error<logger::domain::apply>("failed to undo {} -> {}: {}",
                                                 current.from.string(),
                                                 current.to.string(),
                                                 restored.error().message);
            break;
        }
        undone = s;
    }

    // members that could not be undone are on their new name
    for (std::size_t s = 1; s < undone; ++s)
    {
        report(work.steps[s].item, std::move(outcomes[s]));
    }
    for (std::size_t s = undone; s < last; ++s)
    {
        if (s == failed)
        {
            report(work.steps[s].item, std::move(outcomes[s]));
        }
        else
        {
            report(work.steps[s].item, blocked());
        }
    }

    std::optional<move_result> parked_outcome;
    if (undone == 1)
    {
        const auto restored = move_file(park.to, park.from);
        if (!restored)
        {
            parked_outcome = failure(batchrename::error_code::filesystem_other,
                                     std::format("left at '{}': {}",
                                                 park.to.string(),
                                                 restored.error().message));
        }
    }
    else
    {
        parked_outcome = failure(batchrename::error_code::filesystem_other,
                                 std::format("left at '{}'", park.to.string()));
    }

    if (parked_outcome)
    {
        logger::error<logger::domain::apply>("{} left at {}",
                                             park.from.string(),
                                             park.to.string());
        report(park.item, std::move(parked_outcome.value()));
    }
    else if (failed == last)
    {
        report(park.item, std::move(outcomes[last]));
    }
    else
    {
        report(park.item, blocked());
    }
}

void
run_unit(const unit& work, const std::stop_token& stoken, const report_function& report) noexcept
{
    if (work.cycle)
    {
        run_cycle(work, stoken, report);
    }
    else
    {
        run_chain(work, stoken, report);
    }
}
} // namespace

batchrename::apply_status
batchrename::apply_summary::status() const noexcept
{
    if (this->failed == 0)
    {
        return apply_status::success;
    }
    if (this->succeeded > 0)
    {
        return apply_status::partial;
    }
    return apply_status::error;
}

std::string
batchrename::apply_summary::message() const noexcept
{
    auto message = std::format("Renamed {} files successfully", this->succeeded);
    if (this->failed > 0)
    {
        message.append(std::format(", {} failed", this->failed));
    }
    return message;
}

std::vector<batchrename::apply_result>
batchrename::sorted_by_index(const std::span<const apply_result> results) noexcept
{
    std::vector<apply_result> sorted(results.begin(), results.end());
    std::ranges::stable_sort(sorted, {}, &apply_result::index);
    return sorted;
}

batchrename::apply_engine::apply_engine(const apply_options& options) noexcept
    : options_(options)
{
}

batchrename::apply_engine::~apply_engine() noexcept
{
    if (this->thread_.joinable())
    {
        this->thread_.request_stop();
        this->thread_.join();
    }
}

std::error_code
batchrename::apply_engine::gate(const rename_plan& plan) const noexcept
{
    const auto& report = plan.report();

    if (!report.duplicates.empty())
    {
        return error_code::name_collision;
    }

    if (this->options_.override_conflicts)
    {
        return error_code::none;
    }

    if (!report.invalid_chars.empty())
    {
        return error_code::invalid_character;
    }
    if (!report.existing_files.empty())
    {
        return error_code::existing_file_conflict;
    }
    return error_code::none;
}

std::expected<batchrename::apply_summary, std::error_code>
batchrename::apply_engine::run(const rename_plan& plan, const std::stop_token& stoken) noexcept
{
    if (const auto ec = this->gate(plan); ec)
    {
        logger::error<logger::domain::apply>("refusing to apply plan: {}", ec.message());
        return std::unexpected(ec);
    }

    const auto& items = plan.items();

    apply_summary summary;
    summary.total = items.size();
    summary.results.reserve(items.size());

    std::mutex summary_mutex;
    const report_function report = [&](const std::size_t i, move_result&& outcome)
    {
        const auto& item = items[i];

        std::scoped_lock lock(summary_mutex);

        apply_result result{
            .original_path = item.original_path,
            .new_path = item.new_path,
            .index = item.index,
            .outcome = std::move(outcome),
        };

        if (result.success())
        {
            summary.succeeded += 1;
            logger::info<logger::domain::apply>("{} -> {}",
                                                item.original_path.string(),
                                                item.new_path.string());
        }
        else
        {
            summary.failed += 1;
            summary.errors[static_cast<error_code>(result.outcome.error().kind.value())] += 1;
        }

        // sigc++ signals are not safe to emit from several threads at once
        this->signal_result_.emit(result);
        this->signal_progress_.emit({.completed = summary.results.size() + 1,
                                     .total = summary.total});

        summary.results.push_back(std::move(result));
    };

    bool destination_ready = true;
    if (plan.destination())
    {
        std::error_code ec;
        std::filesystem::create_directories(plan.destination().value(), ec);
        if (ec)
        {
            destination_ready = false;

            const auto reason = std::format("failed to create destination '{}': {}",
                                            plan.destination()->string(),
                                            ec.message());
            logger::error<logger::domain::apply>("{}", reason);
            for (std::size_t i = 0; i < items.size(); ++i)
            {
                report(i, failure(ec, reason));
            }
        }
    }

    if (destination_ready)
    {
        const auto units = schedule(items);

        const auto jobs = std::clamp(static_cast<std::size_t>(this->options_.jobs),
                                     1uz,
                                     std::max(units.size(), 1uz));

        logger::debug<logger::domain::apply>("applying {} renames in {} units with {} jobs",
                                             items.size(),
                                             units.size(),
                                             jobs);

        if (jobs == 1)
        {
            for (const auto& work : units)
            {
                run_unit(work, stoken, report);
            }
        }
        else
        {
            std::atomic<std::size_t> next{0};
            std::vector<std::jthread> workers;
            workers.reserve(jobs);
            for (std::size_t w = 0; w < jobs; ++w)
            {
                workers.emplace_back(
                    [&]
                    {
                        for (auto u = next++; u < units.size(); u = next++)
                        {
                            run_unit(units[u], stoken, report);
                        }
                    });
            }
            // workers join on scope exit
        }
    }

    logger::warn_if<logger::domain::apply>(stoken.stop_requested(), "apply cancelled");
    logger::info<logger::domain::apply>("{}", summary.message());

    this->signal_finished_.emit(summary);

    return summary;
}

std::error_code
batchrename::apply_engine::start(rename_plan plan) noexcept
{
    if (this->running_)
    {
        return std::make_error_code(std::errc::device_or_resource_busy);
    }

    if (const auto ec = this->gate(plan); ec)
    {
        return ec;
    }

    if (this->thread_.joinable())
    {
        this->thread_.join();
    }

    {
        std::scoped_lock lock(this->mutex_);
        this->last_summary_ = std::nullopt;
    }

    this->running_ = true;
    this->thread_ = std::jthread(
        [this, plan = std::move(plan)](const std::stop_token& stoken)
        {
            auto summary = this->run(plan, stoken);
            {
                std::scoped_lock lock(this->mutex_);
                if (summary)
                {
                    this->last_summary_ = std::move(summary.value());
                }
            }
            this->running_ = false;
        });
    pthread_setname_np(this->thread_.native_handle(), "apply-engine");

    return error_code::none;
}

void
batchrename::apply_engine::cancel() noexcept
{
    this->thread_.request_stop();
}

std::optional<batchrename::apply_summary>
batchrename::apply_engine::wait() noexcept
{
    if (this->thread_.joinable())
    {
        this->thread_.join();
    }

    std::scoped_lock lock(this->mutex_);
    return this->last_summary_;
}

bool
batchrename::apply_engine::running() const noexcept
{
    return this->running_;
}
