/// basic_usage.cpp: svcreg introductory example.
///
/// Demonstrates a two-level registry tree:
///   1. A global registry holding long-lived services.
///   2. A per-session child registry whose provider methods inject services
///      from itself and its parent, decorate a parent service and expose a
///      factory.
///   3. Closing the child stops only what it created.

#include <svcreg.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <string>
#include <utility>

// -----------------------------------------------------------------------
// Domain types
// -----------------------------------------------------------------------

struct message_sink {
    virtual ~message_sink() = default;
    virtual void write(const std::string& message) = 0;
};

struct console_sink : message_sink {
    void write(const std::string& message) override {
        std::cout << message << '\n';
    }
};

/// Prefixes every message with the session name.
struct prefixed_sink : message_sink {
    prefixed_sink(std::shared_ptr<message_sink> inner, std::string prefix)
        : inner_(std::move(inner)), prefix_(std::move(prefix)) {}

    void write(const std::string& message) override {
        inner_->write("[" + prefix_ + "] " + message);
    }

private:
    std::shared_ptr<message_sink> inner_;
    std::string prefix_;
};

struct session_info {
    std::string name;
};

struct task {
    int id;
};

struct worker_pool : svcreg::stoppable {
    explicit worker_pool(message_sink& sink) : sink_(sink) {
        sink_.write("worker pool started");
    }
    void stop() override { sink_.write("worker pool stopped"); }

private:
    message_sink& sink_;
};

SVCREG_BASES(console_sink, message_sink);
SVCREG_BASES(prefixed_sink, message_sink);
SVCREG_BASES(worker_pool, svcreg::stoppable);

// -----------------------------------------------------------------------
// Provider for the session registry
// -----------------------------------------------------------------------

struct session_services {
    int next_task = 0;

    std::shared_ptr<session_info> create_session_info() {
        return std::make_shared<session_info>(session_info{"session-1"});
    }

    // First parameter has the return type: decorates the parent's sink.
    std::shared_ptr<message_sink> decorate_sink(std::shared_ptr<message_sink> parent_sink,
                                                const session_info& info) {
        return std::make_shared<prefixed_sink>(std::move(parent_sink), info.name);
    }

    std::shared_ptr<worker_pool> create_worker_pool(message_sink& sink) {
        return std::make_shared<worker_pool>(sink);
    }

    std::shared_ptr<svcreg::factory<task>> create_task_factory() {
        return svcreg::make_factory<task>([this] {
            return std::make_shared<task>(task{++next_task});
        });
    }
};

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main() {
    spdlog::set_level(spdlog::level::debug);

    svcreg::default_service_registry global({.display_name = "global services"});
    global.add<message_sink>(std::make_shared<console_sink>());

    {
        svcreg::default_service_registry session(&global, {.display_name = "session services"});
        session.add_provider(std::make_shared<session_services>(),
                             SVCREG_METHOD(session_services, create_session_info),
                             SVCREG_METHOD(session_services, decorate_sink),
                             SVCREG_METHOD(session_services, create_worker_pool),
                             SVCREG_METHOD(session_services, create_task_factory));

        // The parent's sink, seen through the session's decorator.
        session.get<message_sink>()->write("hello from the session");
        global.get<message_sink>()->write("hello from the global registry");

        session.get<worker_pool>();

        // Factories create a new value every time.
        auto first = session.new_instance<task>();
        auto second = session.new_instance<task>();
        std::cout << "tasks " << first->id << " and " << second->id << '\n';

        try {
            session.get<task>();
        } catch (const svcreg::unknown_service& e) {
            std::cout << "expected: " << e.what() << '\n';
        }

        // Stops the worker pool; the global sink is left alone.
        session.close();
    }

    global.close();
    return 0;
}
