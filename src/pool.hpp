#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

// Versioned handle into a Pool. A handle goes stale when its slot is released.
struct VID {
    std::uint32_t id{0};
    std::uint32_t version{0};

    bool operator==(const VID& o) const { return id == o.id && version == o.version; }
    bool operator!=(const VID& o) const { return !(*this == o); }
};

// Fixed-capacity arena. T must expose `bool active` and `VID vid`.
template <class T, std::size_t N> class Pool {
  public:
    static constexpr std::size_t MAX = N;

    Pool() : items(N), versions(N, 0) {}

    std::optional<VID> alloc() {
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (items[i].active)
                continue;
            items[i] = T{};
            items[i].active = true;
            items[i].vid = VID{static_cast<std::uint32_t>(i), ++versions[i]};
            ++live;
            return items[i].vid;
        }
        return std::nullopt;
    }

    T* get(VID v) {
        if (v.id >= items.size())
            return nullptr;
        T& t = items[v.id];
        if (!t.active || versions[v.id] != v.version)
            return nullptr;
        return &t;
    }
    const T* get(VID v) const {
        if (v.id >= items.size())
            return nullptr;
        const T& t = items[v.id];
        if (!t.active || versions[v.id] != v.version)
            return nullptr;
        return &t;
    }

    void release(VID v) {
        if (T* t = get(v)) {
            t->active = false;
            --live;
        }
    }

    void clear() {
        for (auto& t : items)
            t.active = false;
        live = 0;
    }

    std::size_t count() const { return live; }

    std::vector<T>& data() { return items; }
    const std::vector<T>& data() const { return items; }

  private:
    std::vector<T> items;
    std::vector<std::uint32_t> versions;
    std::size_t live{0};
};
