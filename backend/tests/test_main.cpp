#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

// Library logging is silenced for the whole run.
class QuietLogs : public ::testing::Environment {
public:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }
};

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::AddGlobalTestEnvironment(new QuietLogs);
    return RUN_ALL_TESTS();
}
