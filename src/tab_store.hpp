#pragma once
#include "tab.hpp"
#include <cstdint>
#include <optional>
#include <vector>

// Generation-counted slot arena owning every Tab. Handles returned from
// allocate() stay valid until remove(); afterwards they resolve to nothing,
// even once the slot index is reused.
class TabStore {
public:
    TabHandle allocate();
    bool insert(TabHandle handle, Tab tab);

    Tab* get(TabHandle handle);
    const Tab* get(TabHandle handle) const;

    // Clears the slot and returns the payload; the caller tears it down.
    std::optional<Tab> remove(TabHandle handle);

    size_t size() const { return live_count; }
    bool empty() const { return live_count == 0; }
    std::vector<const Tab*> get_all_tabs() const;

private:
    struct Slot {
        uint32_t generation = 0;
        std::optional<Tab> tab;
    };

    std::vector<Slot> slots;
    std::vector<uint32_t> free_slots;
    size_t live_count = 0;
};
