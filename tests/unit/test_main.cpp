#include <gtest/gtest.h>
#include <glog/logging.h>

int main(int argc, char** argv) {
    // Initialize Google Test
    ::testing::InitGoogleTest(&argc, argv);

    // Decoder warnings go to stderr so they show up next to test failures
    FLAGS_logtostderr = true;
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();

    return RUN_ALL_TESTS();
}
