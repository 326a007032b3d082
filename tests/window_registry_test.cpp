#include <catch2/catch.hpp>

#include "core/window_registry.h"

#include <atomic>
#include <thread>
#include <vector>

// The registry never dereferences controllers, so tests use tagged addresses
static WindowController* FakeWindow(std::uintptr_t tag) {
    return reinterpret_cast<WindowController*>(tag * 16);
}

TEST_CASE("Lookup finds registered windows", "[registry]") {
    WindowRegistry registry;
    registry.Register(0x100, FakeWindow(1));
    registry.Register(0x200, FakeWindow(2));

    CHECK(registry.Lookup(0x100) == FakeWindow(1));
    CHECK(registry.Lookup(0x200) == FakeWindow(2));
    CHECK(registry.Size() == 2);
}

TEST_CASE("Lookup of an unknown handle returns null", "[registry]") {
    WindowRegistry registry;
    CHECK(registry.Lookup(0x100) == nullptr);

    registry.Register(0x100, FakeWindow(1));
    CHECK(registry.Lookup(0x101) == nullptr);
    CHECK(registry.Lookup(0) == nullptr);
}

TEST_CASE("Register replaces an existing entry", "[registry]") {
    WindowRegistry registry;
    registry.Register(0x100, FakeWindow(1));
    registry.Register(0x100, FakeWindow(2));

    CHECK(registry.Lookup(0x100) == FakeWindow(2));
    CHECK(registry.Size() == 1);
}

TEST_CASE("Remove forgets a window", "[registry]") {
    WindowRegistry registry;
    registry.Register(0x100, FakeWindow(1));
    registry.Register(0x200, FakeWindow(2));

    CHECK(registry.Remove(0x100));
    CHECK(registry.Lookup(0x100) == nullptr);
    CHECK(registry.Lookup(0x200) == FakeWindow(2));
    CHECK(registry.Size() == 1);

    CHECK_FALSE(registry.Remove(0x100));
}

TEST_CASE("Separate registries don't share entries", "[registry]") {
    WindowRegistry a;
    WindowRegistry b;
    a.Register(0x100, FakeWindow(1));

    CHECK(a.Lookup(0x100) == FakeWindow(1));
    CHECK(b.Lookup(0x100) == nullptr);
}

TEST_CASE("Lookups run concurrently with a writer", "[registry][threads]") {
    WindowRegistry registry;
    registry.Register(0x1, FakeWindow(1));

    std::atomic<bool> stop{false};
    std::atomic<int> badLookups{0};

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&]() {
            while (!stop) {
                // Entry 0x1 is never touched by the writer
                if (registry.Lookup(0x1) != FakeWindow(1)) ++badLookups;
                WindowController* other = registry.Lookup(0x2);
                if (other != nullptr && other != FakeWindow(2)) ++badLookups;
            }
        });
    }

    for (int i = 0; i < 2000; ++i) {
        registry.Register(0x2, FakeWindow(2));
        registry.Remove(0x2);
    }
    stop = true;
    for (auto& reader : readers) {
        reader.join();
    }

    CHECK(badLookups == 0);
    CHECK(registry.Size() == 1);
}
