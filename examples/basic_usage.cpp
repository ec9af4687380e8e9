/// basic_usage.cpp: libinject introductory example.
///
/// Demonstrates the describe → register → build → resolve workflow:
///   1. Describe injection points with type_builder (no framework base classes).
///   2. Register services, keyed and non-keyed, in a registry.
///   3. Call build() to validate the dependency graph.
///   4. Resolve services, or create and inject objects directly.

#include <libinject.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace libinject;

// -----------------------------------------------------------------------
// Domain interfaces
// -----------------------------------------------------------------------

struct i_logger {
    virtual ~i_logger() = default;
    virtual void log(const std::string& message) = 0;
};

struct i_greeter {
    virtual ~i_greeter() = default;
    virtual std::string greet(const std::string& name) = 0;
};

struct i_clock {
    virtual ~i_clock() = default;
    virtual std::string now() const = 0;
};

// -----------------------------------------------------------------------
// Implementations
// -----------------------------------------------------------------------

struct console_logger : i_logger {
    std::string prefix = "[LOG] ";

    void log(const std::string& message) override {
        std::cout << prefix << message << '\n';
    }
};

struct fixed_clock : i_clock {
    std::string now() const override { return "12:00"; }
};

/// Constructor injection with an optional value, plus an injected clock
/// property and an init method taking a keyed dependency.
class greeter : public i_greeter {
public:
    greeter(std::shared_ptr<i_logger> logger, int repeat)
        : logger_(std::move(logger)), repeat_(repeat) {}

    std::string greet(const std::string& name) override {
        std::string msg = salutation_ + ", " + name + '!';
        if (clock_) msg += " (" + clock_->now() + ")";
        for (int i = 0; i < repeat_; ++i) logger_->log(msg);
        return msg;
    }

    std::shared_ptr<i_clock> clock() const { return clock_; }
    void set_clock(std::shared_ptr<i_clock> c) { clock_ = std::move(c); }

    void init(std::string salutation) { salutation_ = std::move(salutation); }

    static void describe(type_builder<greeter>& b) {
        b.constructor<std::shared_ptr<i_logger>, int>(
             {"logger", param("repeat").default_value(1)})
         .property<&greeter::clock, &greeter::set_clock>("clock", {.inject = true, .optional = true})
         .method<&greeter::init>("init", {param("salutation").keyed("formal")}, {.inject = true});
    }

private:
    std::shared_ptr<i_logger> logger_;
    std::shared_ptr<i_clock> clock_;
    int repeat_;
    std::string salutation_ = "Hello";
};

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main() {
    // Opt in to library diagnostics.
    auto log = spdlog::stdout_color_mt("libinject-example");
    log->set_level(spdlog::level::debug);
    set_logger(log);

    // ── Registration phase ────────────────────────────────────────────
    registry reg;
    reg.add_type<i_logger, console_logger>();
    reg.add_type<i_greeter, greeter>();
    reg.add_value<std::string>("Good day", "formal");

    // ── Build phase (validates the graph) ─────────────────────────────
    auto root = reg.build();

    // ── Resolution phase ──────────────────────────────────────────────
    auto g = root->get<std::shared_ptr<i_greeter>>();
    g->greet("World");

    // A child resolver adds a clock; the greeter created here sees it,
    // and everything else comes from the parent.
    registry child_reg;
    child_reg.add_type<i_clock, fixed_clock>();
    auto child = child_reg.build({.parent = root});

    std::vector<inject_parameter_ptr> overrides{with_parameter<int>(2)};
    auto local = child->create<greeter>(overrides);
    local->greet("Scope");

    std::cout << "metadata cached for " << root->get_injector().cache()->count()
              << " types\n";
    return 0;
}
