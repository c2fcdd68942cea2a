#include "utils/Uuid.h"

#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace UuidHelper {

namespace {

std::mt19937_64 &engine() {
    static std::mt19937_64 gen([] {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd()};
        return std::mt19937_64(seq);
    }());
    return gen;
}

std::mutex g_engineMutex;

} // namespace

std::string generate() {
    uint64_t hi = 0;
    uint64_t lo = 0;
    {
        std::scoped_lock lock(g_engineMutex);
        std::uniform_int_distribution<uint64_t> dis;
        hi = dis(engine());
        lo = dis(engine());
    }

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << (hi >> 32) << "-";
    ss << std::setw(4) << ((hi >> 16) & 0xFFFF) << "-";
    ss << std::setw(4) << ((hi & 0x0FFF) | 0x4000) << "-";
    ss << std::setw(4) << (((lo >> 48) & 0x3FFF) | 0x8000) << "-";
    ss << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return ss.str();
}

std::string pendingToken() { return "pending:" + generate(); }

} // namespace UuidHelper
