#include "DispatcherTestHelper.hpp"

#include <doctest/doctest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace M2M;
using namespace M2M::Testing;

TEST_SUITE("dispatch.concurrency") {

TEST_CASE("concurrent creators keep the container counters exact") {
    DispatcherFixture f;
    REQUIRE(f.create(f.root->rn(), ResourceType::CNT, container("cnt1")).ok());
    auto const cnt = f.store.getByPath(f.path("cnt1"))->ri();

    constexpr int    Writers   = 6;
    constexpr int    PerWriter = 30;
    std::atomic<int> failures{0};
    std::atomic<int> unexpectedReads{0};
    std::atomic<bool> done{false};

    std::thread reader([&] {
        while (!done.load()) {
            auto response = f.retrieve(f.path("cnt1/la"));
            if (response.status != ResponseStatusCode::OK && response.status != ResponseStatusCode::NotFound)
                ++unexpectedReads;
            auto tree = f.retrieve(f.path("cnt1"), {{"rcn", "4"}});
            if (!tree.ok())
                ++unexpectedReads;
        }
    });

    std::vector<std::thread> writers;
    for (int w = 0; w < Writers; ++w) {
        writers.emplace_back([&, w] {
            for (int i = 0; i < PerWriter; ++i) {
                auto const name = "w" + std::to_string(w) + "_" + std::to_string(i);
                if (f.create(f.path("cnt1"), ResourceType::CIN, contentInstance(name, "x")).status != ResponseStatusCode::Created)
                    ++failures;
            }
        });
    }
    for (auto& writer : writers)
        writer.join();
    done = true;
    reader.join();

    CHECK(failures.load() == 0);
    CHECK(unexpectedReads.load() == 0);
    CHECK(f.store.children(cnt, ResourceType::CIN).size() == static_cast<std::size_t>(Writers * PerWriter));
    CHECK(f.store.get(cnt)->intAttribute("cni") == Writers * PerWriter);
    CHECK(f.store.get(cnt)->intAttribute("cbs") == Writers * PerWriter);
}

TEST_CASE("racing creators of one name produce exactly one resource") {
    DispatcherFixture f;
    constexpr int     Racers = 8;
    std::atomic<int>  created{0};
    std::atomic<int>  conflicts{0};

    std::vector<std::thread> racers;
    for (int r = 0; r < Racers; ++r) {
        racers.emplace_back([&] {
            auto response = f.create(f.root->rn(), ResourceType::CNT, container("shared"));
            if (response.status == ResponseStatusCode::Created)
                ++created;
            else if (response.status == ResponseStatusCode::Conflict)
                ++conflicts;
        });
    }
    for (auto& racer : racers)
        racer.join();

    CHECK(created.load() == 1);
    CHECK(conflicts.load() == Racers - 1);
    CHECK(f.store.children(f.root->ri(), ResourceType::CNT).size() == 1);
}

TEST_CASE("updates and deletes of siblings interleave safely") {
    DispatcherFixture f;
    REQUIRE(f.create(f.root->rn(), ResourceType::CNT, container("parent")).ok());
    constexpr int Children = 40;
    for (int i = 0; i < Children; ++i)
        REQUIRE(f.create(f.path("parent"), ResourceType::CIN, contentInstance("c" + std::to_string(i), "v")).ok());

    std::atomic<int> failures{0};
    std::thread      deleter([&] {
        for (int i = 0; i < Children; i += 2) {
            if (f.remove(f.path("parent/c" + std::to_string(i))).status != ResponseStatusCode::Deleted)
                ++failures;
        }
    });
    std::thread updater([&] {
        for (int i = 0; i < Children; ++i) {
            if (!f.update(f.path("parent"), Json{{"m2m:cnt", {{"lbl", {"round:" + std::to_string(i)}}}}}).ok())
                ++failures;
        }
    });
    deleter.join();
    updater.join();

    CHECK(failures.load() == 0);
    auto parent = f.store.getByPath(f.path("parent"));
    CHECK(parent->intAttribute("cni") == Children / 2);
    CHECK(parent->labels() == std::vector<std::string>{"round:" + std::to_string(Children - 1)});
}


TEST_CASE("deleting an ancestor while children are created below it leaves no orphans") {
    constexpr int Rounds   = 40;
    constexpr int Children = 60;
    for (int round = 0; round < Rounds; ++round) {
        CAPTURE(round);
        DispatcherFixture f;
        REQUIRE(f.create(f.root->rn(), ResourceType::CNT, container("p")).ok());
        REQUIRE(f.create(f.path("p"), ResourceType::CNT, container("c")).ok());

        std::atomic<int> unexpected{0};
        std::thread      creator([&] {
            for (int i = 0; i < Children; ++i) {
                auto const status = f.create(f.path("p/c"), ResourceType::CIN, contentInstance("i" + std::to_string(i), "v")).status;
                if (status != ResponseStatusCode::Created && status != ResponseStatusCode::NotFound)
                    ++unexpected;
            }
        });
        std::thread deleter([&] {
            if (f.remove(f.path("p")).status != ResponseStatusCode::Deleted)
                ++unexpected;
        });
        creator.join();
        deleter.join();

        CHECK(unexpected.load() == 0);
        // Only the CSEBase survives
        CHECK(f.store.size() == 1);
        CHECK(f.store.children(f.root->ri()).empty());
        CHECK(f.store.getByPath(f.path("p/c")) == nullptr);
    }
}

}
