/*
 * tessera - Resumable Document Segmentation Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "harness.hpp"
#include "tessera/env.hpp"
#include "tessera/generator.hpp"
#include "tessera/logger.hpp"
#include "tessera/types.hpp"
#include <cstdlib>

using namespace tessera;
using tessera::test::Suite;

int main() {
    Logger::setLevel(LogLevel::ERROR);
    Suite suite("support");

    suite.run("environment values fall back to defaults", [] {
        ::unsetenv("TESSERA_TEST_VALUE");
        CHECK(envInt("TESSERA_TEST_VALUE", 7) == 7);
        CHECK(envString("TESSERA_TEST_VALUE", "dflt") == "dflt");

        ::setenv("TESSERA_TEST_VALUE", "", 1);
        CHECK(envSize("TESSERA_TEST_VALUE", 2000) == 2000);

        ::setenv("TESSERA_TEST_VALUE", "42", 1);
        CHECK(envInt("TESSERA_TEST_VALUE", 7) == 42);
        CHECK(envSize("TESSERA_TEST_VALUE", 2000) == 42);
        CHECK(envString("TESSERA_TEST_VALUE") == "42");

        ::setenv("TESSERA_TEST_VALUE", "0", 1);
        CHECK(envSize("TESSERA_TEST_VALUE", 2000) == 2000);
        CHECK(envInt("TESSERA_TEST_VALUE", 7) == 0);

        ::setenv("TESSERA_TEST_VALUE", "0.25", 1);
        CHECK(envFloat("TESSERA_TEST_VALUE", 1.0f) == 0.25f);

        ::setenv("TESSERA_TEST_VALUE", "many", 1);
        CHECK(envInt("TESSERA_TEST_VALUE", 7) == 7);
        CHECK(envFloat("TESSERA_TEST_VALUE", 1.5f) == 1.5f);
        CHECK(envSize("TESSERA_TEST_VALUE", 2000) == 2000);

        ::unsetenv("TESSERA_TEST_VALUE");
    });

    suite.run("numeric flags must be whole integers", [] {
        CHECK(parseCount("3") == std::size_t{3});
        CHECK(parseCount("0") == std::size_t{0});
        CHECK(parseCount("4000") == std::size_t{4000});
        CHECK(!parseCount("3abc").has_value());
        CHECK(!parseCount("12 ").has_value());
        CHECK(!parseCount("-1").has_value());
        CHECK(!parseCount("+5").has_value());
        CHECK(!parseCount("").has_value());
        CHECK(!parseCount("99999999999999999999999").has_value());
    });

    suite.run("log levels parse case-insensitively", [] {
        CHECK(Logger::parseLevel("error") == LogLevel::ERROR);
        CHECK(Logger::parseLevel("WARNING") == LogLevel::WARN);
        CHECK(Logger::parseLevel("Warn") == LogLevel::WARN);
        CHECK(Logger::parseLevel("debug") == LogLevel::DEBUG);
        CHECK(!Logger::parseLevel("loud").has_value());
        CHECK(!Logger::parseLevel("").has_value());
    });

    suite.run("logger init honours the environment over the fallback", [] {
        ::setenv("TESSERA_LOG_LEVEL", "debug", 1);
        Logger::init("support_test", LogLevel::WARN);
        CHECK(Logger::level() == LogLevel::DEBUG);
        CHECK(Logger::enabled(LogLevel::INFO));

        ::setenv("TESSERA_LOG_LEVEL", "bogus", 1);
        Logger::init("support_test", LogLevel::ERROR);
        CHECK(Logger::level() == LogLevel::ERROR);

        ::unsetenv("TESSERA_LOG_LEVEL");
        Logger::init("support_test", LogLevel::WARN);
        CHECK(Logger::level() == LogLevel::WARN);
        CHECK(!Logger::enabled(LogLevel::INFO));

        Logger::setLevel(LogLevel::ERROR);
    });

    suite.run("status names round trip through the job format", [] {
        CHECK(std::string(statusToString(Status::Pending)) == "pending");
        CHECK(parseStatus("done") == Status::Done);
        CHECK(parseStatus("error") == Status::Error);
        CHECK(!parseStatus("DONE").has_value());
        CHECK(!parseStatus("failed").has_value());
    });

    suite.run("reasoning blocks are removed from generated text", [] {
        CHECK(stripThinkBlocks("<think>plan\nsteps</think>\n\nBonjour") == "Bonjour");
        CHECK(stripThinkBlocks("  plain answer") == "plain answer");
        CHECK(stripThinkBlocks("<think>a</think>x<think>b</think> y") == "xy");
        CHECK(stripThinkBlocks("<think>only</think>   ").empty());
        CHECK(stripThinkBlocks("keeps trailing space ") == "keeps trailing space ");
    });

    return suite.finish();
}
