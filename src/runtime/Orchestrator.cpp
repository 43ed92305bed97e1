#include "runtime/Orchestrator.hpp"
#include "runtime/Channel.hpp"
#include "runtime/WorkerPool.hpp"
#include "util/Logger.hpp"
#include <format>
#include <optional>
#include <stdexcept>

namespace lazybar::runtime {

using util::Logger;

namespace {

size_t slot_of(bar::Alignment alignment) {
    switch (alignment) {
        case bar::Alignment::Left: return 0;
        case bar::Alignment::Center: return 1;
        case bar::Alignment::Right: return 2;
    }
    return 0;
}

constexpr bar::Alignment ALIGNMENTS[] = {bar::Alignment::Left, bar::Alignment::Center, bar::Alignment::Right};

}  // namespace

std::vector<bar::Panel>& BringUpResult::panels(bar::Alignment alignment) {
    switch (alignment) {
        case bar::Alignment::Left: return left;
        case bar::Alignment::Center: return center;
        case bar::Alignment::Right: return right;
    }
    return left;
}

std::string format_panel_error(bar::Alignment alignment, size_t index, const std::string& message) {
    return std::format("Error produced by {} panel at index {}: {}", bar::alignment_name(alignment), index,
                       message);
}

Orchestrator::Orchestrator(draw::Surface& surface, draw::Attrs default_attrs, int height, Scheduler& scheduler)
    : surface_(surface), default_attrs_(std::move(default_attrs)), height_(height), scheduler_(scheduler) {}

void Orchestrator::add(bar::Alignment alignment, panels::PanelConfigPtr config) {
    size_t& count = counts_[slot_of(alignment)];
    configs_.push_back(Entry{alignment, count, std::move(config)});
    ++count;
}

Orchestrator::SetupResult Orchestrator::setup(Entry& entry) {
    SetupResult result;
    result.alignment = entry.alignment;
    result.index = entry.index;

    auto [name, visible] = entry.config->props();
    result.name = name;
    result.visible = visible;

    try {
        result.run = entry.config->run(surface_, default_attrs_, height_, scheduler_);
        if (!result.run.stream) {
            throw std::runtime_error("panel produced no update stream");
        }
        result.ok = true;
    } catch (const std::exception& e) {
        result.error = e.what();
    }
    return result;
}

BringUpResult Orchestrator::start() {
    if (started_) {
        throw std::logic_error("Orchestrator::start called twice");
    }
    started_ = true;

    Logger::info("Orchestrator: Starting " + std::to_string(configs_.size()) + " panels");

    auto results = Channel<SetupResult>::create();
    auto& pool = WorkerPool::instance();
    for (auto& entry : configs_) {
        Entry* target = &entry;
        bool submitted = pool.submit_job([this, target, results]() { results->send(setup(*target)); });
        if (!submitted) {
            // Queue full, run it here instead
            results->send(setup(entry));
        }
    }

    // One slot per configured panel, filled as setups finish in any order
    std::vector<std::optional<SetupResult>> slots[3];
    for (size_t i = 0; i < 3; i++) {
        slots[i].resize(counts_[i]);
    }

    BringUpResult bring_up;
    for (size_t received = 0; received < configs_.size(); received++) {
        auto result = results->receive();
        if (!result) {
            throw std::runtime_error("Panel setup channel closed early");
        }
        if (!result->ok) {
            Logger::error(format_panel_error(result->alignment, result->index,
                                             "setup of " + result->name + " failed: " + result->error));
            bring_up.failed++;
            continue;
        }
        auto slot = slot_of(result->alignment);
        slots[slot][result->index] = std::move(*result);
    }

    bring_up.streams = std::make_unique<PanelStreams>();
    for (auto alignment : ALIGNMENTS) {
        auto& group = bring_up.panels(alignment);
        auto inner = std::make_unique<StreamMap<size_t, bar::PanelUpdate>>();

        for (auto& slot : slots[slot_of(alignment)]) {
            if (!slot) continue;
            size_t index = group.size();
            group.emplace_back(slot->name, slot->visible, slot->run.events);
            inner->insert(index, std::move(slot->run.stream));
        }

        Logger::debug(std::format("Orchestrator: {} group has {} panels", bar::alignment_name(alignment),
                                  group.size()));
        if (!inner->empty()) {
            bring_up.streams->insert(alignment, std::move(inner));
        }
    }

    Logger::info(std::format("Orchestrator: {} panels running, {} failed",
                             configs_.size() - bring_up.failed, bring_up.failed));
    return bring_up;
}

}  // namespace lazybar::runtime
