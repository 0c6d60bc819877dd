// Audio id generation: strictly increasing ids, custom offset and concurrent callers.
#include <cstdint>
#include <cstdio>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "audio_id.hpp"
#include "logging.hpp"
#include "tonie_encoder.hpp"

using namespace tonieforge;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        fprintf(stderr, "[audio_id_unit] FAIL: %s\n", msg.c_str());
    }
    return cond;
}

bool test_monotonic_within_a_second() {
    bool ok = true;
    uint32_t now = 1700000000;
    AudioIdGenerator ids([&now] { return now; });
    const uint32_t a = ids.next();
    const uint32_t b = ids.next();
    const uint32_t c = ids.next();
    ok &= check(a == now && b == now + 1 && c == now + 2, "same second yields last + 1");

    now += 100;
    ok &= check(ids.next() == now, "clock ahead of the last id wins");

    now -= 50;
    ok &= check(ids.next() == now + 51, "clock going backwards still increases");
    return ok;
}

bool test_custom_offset() {
    uint32_t now = 1700000000;
    AudioIdGenerator ids([&now] { return now; });
    const uint32_t plain = ids.next();
    const uint32_t custom = ids.next(true);
    return check(custom == plain + 1 - kCustomAudioIdOffset,
                 "custom id subtracts the offset after increasing");
}

bool test_resolve_audio_id() {
    bool ok = true;
    AudioIdGenerator ids([] { return 42u; });
    EncodeOptions options;
    options.id_generator = &ids;
    ok &= check(resolve_audio_id(0x1234, options) == 0x1234, "explicit id kept");
    ok &= check(resolve_audio_id(0, options) == 42, "zero draws from the generator");
    ok &= check(resolve_audio_id(0, options) == 43, "second draw increases");
    return ok;
}

bool test_concurrent_callers_get_unique_ids() {
    AudioIdGenerator ids([] { return 1000u; });
    constexpr int kThreads = 4;
    constexpr int kPerThread = 250;
    std::vector<std::vector<uint32_t>> issued(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&ids, &issued, t] {
            for (int i = 0; i < kPerThread; ++i) {
                issued[t].push_back(ids.next());
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }
    std::set<uint32_t> unique;
    for (const auto &list : issued) {
        unique.insert(list.begin(), list.end());
    }
    bool ok = check(unique.size() == kThreads * kPerThread, "no id issued twice");
    ok &= check(*unique.begin() == 1000 && *unique.rbegin() == 1000 + kThreads * kPerThread - 1,
                "ids are dense");
    return ok;
}

bool test_shared_generator() {
    const uint32_t a = AudioIdGenerator::shared().next();
    const uint32_t b = AudioIdGenerator::shared().next();
    return check(b > a && a + 5 >= unix_time_seconds(), "shared generator follows the clock");
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Error);
    bool ok = true;
    ok &= test_monotonic_within_a_second();
    ok &= test_custom_offset();
    ok &= test_resolve_audio_id();
    ok &= test_concurrent_callers_get_unique_ids();
    ok &= test_shared_generator();
    return ok ? 0 : 1;
}
