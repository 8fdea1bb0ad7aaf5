/**
 * @file progress_aggregator.cpp
 * @brief Implementation of transfer progress aggregation and rendering
 */

#include "kcenon/cube/transfer/progress_aggregator.h"

#include <iomanip>
#include <ostream>
#include <sstream>
#include <type_traits>
#include <variant>

namespace kcenon::cube {

transfer_progress_aggregator::transfer_progress_aggregator(
    uint64_t size_threshold,
    std::optional<std::size_t> total_files,
    std::shared_ptr<progress_renderer> renderer)
    : size_threshold_(size_threshold), renderer_(std::move(renderer)) {
    state_.total_files = total_files;
}

void transfer_progress_aggregator::update(const transfer_event& event) {
    progress_snapshot copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::visit([this](const auto& e) {
            using event_type = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<event_type, transfer_start>) {
                on_start(e);
            } else if constexpr (std::is_same_v<event_type, transfer_chunk>) {
                on_chunk(e);
            } else {
                on_done(e);
            }
        }, event);
        if (!renderer_) {
            return;
        }
        copy = state_;
    }
    renderer_->render(copy);
}

void transfer_progress_aggregator::consume(event_channel<transfer_event>& channel) {
    while (auto event = channel.receive()) {
        update(*event);
    }
    if (renderer_) {
        renderer_->finish(snapshot());
    }
}

void transfer_progress_aggregator::on_start(const transfer_start& event) {
    state_.total_size += event.size;
    if (event.size >= size_threshold_) {
        state_.bars[event.id] = progress_bar_state{event.name, event.size, 0};
    }
}

void transfer_progress_aggregator::on_chunk(const transfer_chunk& event) {
    state_.bytes_transferred += event.delta;
    auto it = state_.bars.find(event.id);
    if (it != state_.bars.end()) {
        it->second.position += event.delta;
    }
}

void transfer_progress_aggregator::on_done(const transfer_done& event) {
    state_.bars.erase(event.id);
    ++state_.completed;
}

auto transfer_progress_aggregator::total_size() const -> uint64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.total_size;
}

auto transfer_progress_aggregator::bytes_transferred() const -> uint64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.bytes_transferred;
}

auto transfer_progress_aggregator::completed() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.completed;
}

auto transfer_progress_aggregator::active_bars() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.bars.size();
}

auto transfer_progress_aggregator::bar(task_id id) const -> std::optional<progress_bar_state> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.bars.find(id);
    if (it == state_.bars.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto transfer_progress_aggregator::snapshot() const -> progress_snapshot {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

// ============================================================================
// console_progress_renderer
// ============================================================================

console_progress_renderer::console_progress_renderer(std::ostream& out,
                                                     std::chrono::milliseconds interval)
    : out_(out), interval_(interval) {}

void console_progress_renderer::render(const progress_snapshot& snapshot) {
    auto now = std::chrono::steady_clock::now();
    if (now - last_draw_ < interval_) {
        return;
    }
    last_draw_ = now;
    draw(snapshot);
}

void console_progress_renderer::finish(const progress_snapshot& snapshot) {
    draw(snapshot);
    out_ << std::endl;
}

void console_progress_renderer::draw(const progress_snapshot& snapshot) {
    std::ostringstream line;
    line << "\r[" << snapshot.completed;
    if (snapshot.total_files) {
        line << "/" << *snapshot.total_files;
    }
    line << " files] " << format_bytes(snapshot.bytes_transferred);

    for (const auto& [id, bar] : snapshot.bars) {
        line << " | " << bar.name << " ";
        if (bar.size > 0) {
            line << std::fixed << std::setprecision(1)
                 << 100.0 * static_cast<double>(bar.position) / static_cast<double>(bar.size)
                 << "%";
        } else {
            line << format_bytes(bar.position);
        }
    }
    line << "     ";
    out_ << line.str() << std::flush;
}

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

}  // namespace kcenon::cube
