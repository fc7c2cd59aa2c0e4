#include <cassert>
#include <iostream>
#include <parallax/core/latest_slot.hpp>
#include <string>
#include <thread>

using parallax::core::LatestSlot;

int main() {
    std::cout << "=== Testing latest-value slot ===" << std::endl;

    {
        LatestSlot<int> slot;
        assert(!slot.hasValue());
        assert(!slot.take());

        assert(slot.publish(1));
        assert(slot.publish(2));
        assert(slot.publish(3));
        assert(slot.hasValue());
        assert(slot.publishedCount() == 3);

        auto value = slot.take();
        assert(value && *value == 3 && "Last value wins");
        assert(!slot.take() && "take() empties the slot");
        std::cout << "  ✓ last value wins, no queueing" << std::endl;
    }

    {
        LatestSlot<std::string> slot;
        slot.publish("pending");
        slot.close();
        assert(slot.isClosed());
        assert(!slot.hasValue() && "Closing drops the pending value");

        assert(!slot.publish("late") && "Publish after close is a no-op");
        assert(!slot.take());
        assert(slot.publishedCount() == 1);

        slot.reopen();
        assert(slot.publish("fresh"));
        assert(*slot.take() == "fresh");
        std::cout << "  ✓ closed slot ignores late publishes" << std::endl;
    }

    {
        LatestSlot<int> slot;
        std::thread producer([&] {
            for (int i = 1; i <= 10000; ++i)
                slot.publish(i);
        });

        int last = 0;
        while (last < 10000) {
            if (auto v = slot.take()) {
                assert(*v > last && "Values never go backwards");
                last = *v;
            }
        }
        producer.join();
        assert(slot.publishedCount() == 10000);
        std::cout << "  ✓ producer thread handoff" << std::endl;
    }

    std::cout << "\nAll latest-value slot tests passed" << std::endl;
    return 0;
}
