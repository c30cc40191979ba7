#include "signal/CandleCache.h"

#include <cassert>
#include <iostream>
#include <stdexcept>

using quantscan::signal::RingBuffer;

int main() {
    {
        RingBuffer<int> buffer(3);
        assert(buffer.empty());
        assert(buffer.capacity() == 3);

        for (int i = 1; i <= 5; ++i) {
            buffer.push(i);
        }
        assert(buffer.full());
        assert(buffer.size() == 3);
        assert(buffer[0] == 3);
        assert(buffer[2] == 5);
        assert(buffer.back() == 5);

        const auto all = buffer.toVector();
        assert((all == std::vector<int>{3, 4, 5}));
        assert((buffer.tail(2) == std::vector<int>{4, 5}));
        assert(buffer.tail(10).size() == 3);
    }

    {
        RingBuffer<int> buffer(4);
        buffer.push(7);
        buffer.push(8);
        assert(!buffer.full());
        assert(buffer[0] == 7);
        assert((buffer.tail(5) == std::vector<int>{7, 8}));

        buffer.clear();
        assert(buffer.empty());
        bool threw = false;
        try {
            (void)buffer.back();
        } catch (const std::out_of_range&) {
            threw = true;
        }
        assert(threw);
    }

    {
        bool threw = false;
        try {
            RingBuffer<int> buffer(0);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] CandleCache PASSED\n";
    return 0;
}
