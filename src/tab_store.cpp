#include "tab_store.hpp"
#include <spdlog/spdlog.h>

TabHandle TabStore::allocate() {
    if (!free_slots.empty()) {
        uint32_t index = free_slots.back();
        free_slots.pop_back();
        return TabHandle(index, slots[index].generation);
    }

    uint32_t index = static_cast<uint32_t>(slots.size());
    slots.push_back(Slot());
    return TabHandle(index, 0);
}

bool TabStore::insert(TabHandle handle, Tab tab) {
    if (handle.slot_index >= slots.size()) {
        spdlog::warn("Refusing to insert tab with unallocated handle {}", to_string(handle));
        return false;
    }

    Slot& slot = slots[handle.slot_index];
    if (slot.generation != handle.generation || slot.tab) {
        spdlog::warn("Refusing to insert tab into slot {} with stale handle {}",
                     handle.slot_index, to_string(handle));
        return false;
    }

    tab.handle = handle;
    slot.tab = std::move(tab);
    ++live_count;
    return true;
}

Tab* TabStore::get(TabHandle handle) {
    if (handle.slot_index >= slots.size()) return nullptr;

    Slot& slot = slots[handle.slot_index];
    if (slot.generation != handle.generation || !slot.tab) return nullptr;
    return &*slot.tab;
}

const Tab* TabStore::get(TabHandle handle) const {
    if (handle.slot_index >= slots.size()) return nullptr;

    const Slot& slot = slots[handle.slot_index];
    if (slot.generation != handle.generation || !slot.tab) return nullptr;
    return &*slot.tab;
}

std::optional<Tab> TabStore::remove(TabHandle handle) {
    if (!get(handle)) return std::nullopt;

    Slot& slot = slots[handle.slot_index];
    std::optional<Tab> removed = std::move(slot.tab);
    slot.tab.reset();
    // Wrapping is fine: unsigned overflow is well defined.
    slot.generation += 1;
    free_slots.push_back(handle.slot_index);
    --live_count;
    return removed;
}

std::vector<const Tab*> TabStore::get_all_tabs() const {
    std::vector<const Tab*> tabs;
    tabs.reserve(live_count);
    for (const Slot& slot : slots) {
        if (slot.tab) tabs.push_back(&*slot.tab);
    }
    return tabs;
}
