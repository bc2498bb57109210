/**
 * @file test_uuid.cpp
 * @brief Unit tests for client id generation
 */

#include <gtest/gtest.h>
#include <psgui/utils/uuid.hpp>

#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using psgui::utils::generateUuid;
using psgui::utils::isUuid;

TEST(UuidTest, LayoutAndVersion) {
    const std::string id = generateUuid();
    ASSERT_TRUE(isUuid(id)) << id;
    EXPECT_EQ(id[14], '4');
    EXPECT_EQ(id.find_first_of("ABCDEF"), std::string::npos) << "expected lowercase: " << id;
}

TEST(UuidTest, VariantNibbleIsRfc4122) {
    for (int round = 0; round < 64; ++round) {
        const std::string id = generateUuid();
        const char variant = id[19];
        EXPECT_TRUE(variant == '8' || variant == '9' || variant == 'a' || variant == 'b') << id;
    }
}

TEST(UuidTest, IdsFromManyThreadsAreDistinct) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 250;

    std::mutex mutex;
    std::set<std::string> seen;
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&]() {
            std::vector<std::string> local;
            for (int i = 0; i < kPerThread; ++i) {
                local.push_back(generateUuid());
            }
            std::lock_guard<std::mutex> lock(mutex);
            seen.insert(local.begin(), local.end());
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_EQ(seen.size(), static_cast<size_t>(kThreads * kPerThread));
}

TEST(UuidTest, IsUuidChecksDashesAndHex) {
    EXPECT_TRUE(isUuid("123e4567-e89b-42d3-a456-426614174000"));
    EXPECT_TRUE(isUuid("123E4567-E89B-42D3-A456-426614174000"));

    EXPECT_FALSE(isUuid(""));
    EXPECT_FALSE(isUuid("123e4567e89b42d3a456426614174000"));
    EXPECT_FALSE(isUuid("123e4567-e89b-42d3-a456-42661417400"));
    EXPECT_FALSE(isUuid("123e4567-e89b-42d3-a456-42661417400z"));
    EXPECT_FALSE(isUuid("123e4567-e89b-42d3+a456-426614174000"));
}
