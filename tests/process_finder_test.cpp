#include "fakes.hpp"
#include "process_finder.hpp"

#include <catch2/catch.hpp>

#include <set>
#include <stdexcept>
#include <vector>

using reap::ProcessFinder;
using reap::ProcessSet;
using reap::testing::FakeProcessDataProvider;
using reap::testing::make_process;

TEST_CASE("ProcessFinder matches the pattern anywhere in the command line", "[finder]") {
    FakeProcessDataProvider provider({{
        make_process(101, "/usr/local/bin/ollama serve"),
        make_process(102, "/usr/bin/python3 client.py --host ollama.local"),
        make_process(103, "/usr/sbin/sshd -D"),
    }});
    ProcessFinder finder(&provider, 9999, 9998);

    REQUIRE(finder.find("ollama") == ProcessSet{101, 102});
}

TEST_CASE("ProcessFinder returns an empty set when nothing matches", "[finder]") {
    FakeProcessDataProvider provider({{
        make_process(10, "/usr/sbin/cron -f"),
    }});
    ProcessFinder finder(&provider, 9999, 9998);

    REQUIRE(finder.find("ollama").empty());
}

TEST_CASE("ProcessFinder never selects its own process", "[finder]") {
    FakeProcessDataProvider provider({{
        make_process(500, "kill-ollama"),
        make_process(501, "ollama runner --port 11434"),
    }});
    ProcessFinder finder(&provider, 500, 499);

    REQUIRE(finder.find("ollama") == ProcessSet{501});
}

namespace {

reap::ProcessInfo child_of(int parent, reap::ProcessInfo info) {
    info.parent_pid = parent;
    return info;
}

} // namespace

TEST_CASE("ProcessFinder skips the wrappers that launched it", "[finder]") {
    // bash (300) -> sudo kill-ollama (400) -> kill-ollama (500)
    FakeProcessDataProvider provider({{
        child_of(1, make_process(300, "bash -c kill-ollama")),
        child_of(300, make_process(400, "sudo kill-ollama")),
        child_of(400, make_process(500, "kill-ollama")),
        child_of(1, make_process(600, "/usr/local/bin/ollama serve")),
        child_of(400, make_process(700, "sudo kill-ollama --sibling")),
    }});
    ProcessFinder finder(&provider, 500, 400);

    REQUIRE(finder.find("ollama") == ProcessSet{600, 700});
}

TEST_CASE("ProcessFinder excludes the parent even when it is missing from the snapshot", "[finder]") {
    FakeProcessDataProvider provider({{
        make_process(600, "ollama serve"),
    }});
    ProcessFinder finder(&provider, 500, 600);

    REQUIRE(finder.find("ollama").empty());
}

TEST_CASE("ProcessFinder lineage stops on a parent cycle", "[finder]") {
    const std::vector<reap::ProcessInfo> snapshot = {
        child_of(20, make_process(10, "a")),
        child_of(10, make_process(20, "b")),
    };

    REQUIRE(ProcessFinder::lineage(snapshot, 5, 10) == std::set<int>{5, 10, 20});
}

TEST_CASE("ProcessFinder is case-sensitive", "[finder]") {
    FakeProcessDataProvider provider({{
        make_process(7, "/opt/Ollama/Ollama.app"),
    }});
    ProcessFinder finder(&provider, 9999, 9998);

    REQUIRE(finder.find("ollama").empty());
    REQUIRE(finder.find("Ollama") == ProcessSet{7});
}

TEST_CASE("ProcessFinder falls back to the short name for kernel threads", "[finder]") {
    const auto kthread = make_process(42, "", "ollama_kworker");
    REQUIRE(ProcessFinder::matches(kthread, "ollama"));

    const auto named_but_unrelated = make_process(43, "/bin/bash", "ollama");
    REQUIRE_FALSE(ProcessFinder::matches(named_but_unrelated, "ollama"));
}

TEST_CASE("ProcessFinder returns ascending unique PIDs", "[finder]") {
    FakeProcessDataProvider provider({{
        make_process(300, "ollama serve"),
        make_process(20, "ollama run llama3"),
        make_process(300, "ollama serve"),
        make_process(0, "ollama"),
    }});
    ProcessFinder finder(&provider, 9999, 9998);

    REQUIRE(finder.find("ollama") == ProcessSet{20, 300});
}

TEST_CASE("ProcessFinder rejects an empty pattern and a null provider", "[finder]") {
    FakeProcessDataProvider provider;
    ProcessFinder finder(&provider, 1, 0);

    REQUIRE_THROWS_AS(finder.find(""), std::invalid_argument);
    REQUIRE_THROWS_AS(ProcessFinder(nullptr, 1, 0), std::invalid_argument);
}
