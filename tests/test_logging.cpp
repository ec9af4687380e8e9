#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "test_support.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <any>
#include <atomic>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

using namespace libinject;
using Catch::Matchers::ContainsSubstring;

namespace {

struct ReadOnly {
    int level() const { return 3; }

    static void describe(type_builder<ReadOnly>& b) {
        b.property<&ReadOnly::level>("level", {.inject = true});
    }
};

struct OptionalCount {
    int count = 5;

    static void describe(type_builder<OptionalCount>& b) {
        b.field<&OptionalCount::count>("count", {.inject = true, .optional = true});
    }
};

/// Routes the library logger into a string for the lifetime of the object.
class captured_log {
public:
    explicit captured_log(spdlog::level::level_enum level = spdlog::level::trace) {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out_);
        auto logger = std::make_shared<spdlog::logger>("libinject-test", sink);
        logger->set_level(level);
        logger->set_pattern("%l %v");
        set_logger(logger);
    }

    ~captured_log() { set_logger(nullptr); }

    std::string text() {
        get_logger()->flush();
        return out_.str();
    }

private:
    std::ostringstream out_;
};

} // namespace

TEST_CASE("The default logger discards output", "[logging]") {
    auto logger = get_logger();
    REQUIRE(logger != nullptr);
    REQUIRE(logger->name() == "libinject");
}

TEST_CASE("set_logger replaces and restores the logger", "[logging]") {
    {
        captured_log log;
        REQUIRE(get_logger()->name() == "libinject-test");
    }
    REQUIRE(get_logger()->name() == "libinject");
}

TEST_CASE("Read-only injected properties are reported", "[logging]") {
    captured_log log;
    injector inj;
    inj.metadata(type_of<ReadOnly>());

    auto text = log.text();
    REQUIRE_THAT(text, ContainsSubstring("warning Skipping read-only property"));
    REQUIRE_THAT(text, ContainsSubstring("ReadOnly::level"));
    REQUIRE_THAT(text, ContainsSubstring("debug Built injection metadata"));
}

TEST_CASE("Recovered optional dependencies are logged", "[logging]") {
    captured_log log;
    test::map_resolver r;
    injector inj;
    auto obj = inj.create<OptionalCount>(r);
    REQUIRE(obj->count == 5);

    auto text = log.text();
    REQUIRE_THAT(text, ContainsSubstring("Optional dependency 'count'"));
    REQUIRE_THAT(text, ContainsSubstring("trace Created instance of"));
    REQUIRE_THAT(text, ContainsSubstring("Left optional field"));
}

TEST_CASE("Recovered optional dependencies stay quiet above debug level", "[logging]") {
    captured_log log(spdlog::level::info);
    test::map_resolver r;
    injector inj;
    auto obj = inj.create<OptionalCount>(r);
    REQUIRE(obj->count == 5);

    auto param = test::make_param<std::shared_ptr<ReadOnly>>("missing");
    param.is_optional = true;
    REQUIRE(std::any_cast<std::shared_ptr<ReadOnly>>(resolve_value(param, r)) == nullptr);

    REQUIRE(log.text().empty());
}

TEST_CASE("The logger can be swapped while other threads log", "[logging]") {
    test::map_resolver r;
    auto param = test::make_param<int>("count");
    param.is_optional = true;

    std::atomic<bool> stop{false};
    std::jthread worker([&] {
        while (!stop.load()) {
            (void)resolve_value(param, r);
        }
    });

    for (int i = 0; i < 50; ++i) {
        auto logger = std::make_shared<spdlog::logger>(
            "libinject-swap", std::make_shared<spdlog::sinks::null_sink_mt>());
        logger->set_level(i % 2 == 0 ? spdlog::level::trace : spdlog::level::off);
        set_logger(logger);
        REQUIRE(get_logger() == logger);
    }
    stop = true;
    worker.join();
    set_logger(nullptr);
    REQUIRE(get_logger()->name() == "libinject");
}
