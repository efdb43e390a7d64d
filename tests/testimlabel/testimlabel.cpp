#include <libimlabel/Platform/Log.h>
#include <libimlabel/Platform/LogLevel.h>

#include <gtest/gtest.h>

// top-level test entrypoint: the tests themselves live beside the code they
// test (as `*.tests.cpp` files) and are linked into this executable

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    iml::set_log_level(iml::LogLevel::err);  // keep expected warnings out of the test output
    return RUN_ALL_TESTS();
}
