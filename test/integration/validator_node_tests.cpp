// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Integration tests for cluster/validator_node - production, relay and catch-up

#include <catch2/catch_test_macros.hpp>
#include "cluster/validator_node.hpp"
#include "network/message.hpp"
#include "network/proxy.hpp"
#include "util/time.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

using namespace dropnet;
using namespace dropnet::cluster;
using namespace std::chrono_literals;

namespace {

constexpr uint32_t kMagic = protocol::magic::LOCALNET;

chain::GenesisConfig Genesis(int validators, int64_t genesis_time_ms = 0) {
    chain::GenesisConfig genesis;
    genesis.genesis_time_ms = genesis_time_ms;
    for (int i = 0; i < validators; ++i) {
        genesis.validators.push_back(static_cast<uint32_t>(i));
    }
    return genesis;
}

chain::NodeConfig FastNodeConfig() {
    chain::NodeConfig config;
    config.block_production_interval_ms = 10;
    config.status_interval_ms = 40;
    config.max_blocks_per_request = 4;
    return config;
}

bool WaitFor(const std::function<bool()> &condition, std::chrono::milliseconds timeout = 5s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!condition()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

// Forwards everything except the first `drop_blocks` block messages
class LossyBlockHandler : public network::ProxyHandler {
public:
    explicit LossyBlockHandler(int drop_blocks) : remaining_(drop_blocks) {}

    bool handle(const message::Message &msg, int, int) override {
        if (msg.command() == protocol::commands::BLOCK && remaining_ > 0) {
            --remaining_;
            return false;
        }
        return true;
    }

private:
    int remaining_;
};

// Two or more nodes wired through a proxy whose handlers come from factory
struct Network {
    network::InterceptFault fault;
    network::Proxy proxy;
    std::vector<std::unique_ptr<ValidatorNode>> nodes;

    Network(std::vector<chain::GenesisConfig> geneses, network::ProxyHandlerFactory factory)
        : proxy(network::ProxyConfig{}, std::move(factory), fault) {
        const int n = static_cast<int>(geneses.size());
        for (int i = 0; i < n; ++i) {
            nodes.push_back(std::make_unique<ValidatorNode>(i, geneses[i], FastNodeConfig(), kMagic));
        }
        for (int from = 0; from < n; ++from) {
            for (int to = 0; to < n; ++to) {
                if (from == to) {
                    continue;
                }
                auto link = proxy.create_link(from, to);
                ValidatorNode *destination = nodes[to].get();
                link->set_receive_callback([destination, from](const std::vector<uint8_t> &frame) {
                    destination->Deliver(from, frame);
                });
                nodes[from]->AddPeer(link);
            }
        }
        proxy.start();
        for (auto &node : nodes) {
            node->Start();
        }
    }

    ~Network() {
        proxy.stop();
        for (auto &node : nodes) {
            node->Stop();
        }
    }
};

network::ProxyHandlerFactory PassThrough() {
    return [](int, int) { return std::make_unique<LossyBlockHandler>(0); };
}

} // namespace

TEST_CASE("ValidatorNode - genesis", "[cluster][node]") {
    ValidatorNode node(0, Genesis(1), FastNodeConfig(), kMagic);

    REQUIRE(node.head_height() == 0);
    REQUIRE(node.head_hash() == node.genesis_hash());
    REQUIRE(node.genesis_hash() == chain::MakeGenesisBlock(Genesis(1)).GetHash());
    REQUIRE_FALSE(node.IsRunning());

    auto genesis_block = node.GetBlock(0);
    REQUIRE(genesis_block.has_value());
    REQUIRE(genesis_block->header.inner_lite.producer == chain::GENESIS_PRODUCER);
    REQUIRE_FALSE(node.GetBlock(1).has_value());
}

TEST_CASE("ValidatorNode - single validator produces alone", "[cluster][node]") {
    ValidatorNode node(0, Genesis(1), FastNodeConfig(), kMagic);
    node.Start();
    REQUIRE(WaitFor([&] { return node.head_height() >= 5; }));
    node.Stop();
    node.Stop();

    REQUIRE_FALSE(node.IsRunning());
    const uint64_t head = node.head_height();
    for (uint64_t h = 1; h <= head; ++h) {
        auto block = node.GetBlock(h);
        auto parent = node.GetBlock(h - 1);
        REQUIRE(block.has_value());
        REQUIRE(block->header.inner_lite.prev_hash == parent->GetHash());
        REQUIRE(block->header.inner_lite.producer == 0);
        REQUIRE(block->header.inner_lite.epoch_id == h / 100);
    }
    REQUIRE(node.stats().produced == head);
}

TEST_CASE("ValidatorNode - block timestamps follow mock time", "[cluster][node]") {
    util::MockTimeScope mock(1700000000);
    ValidatorNode node(0, Genesis(1), FastNodeConfig(), kMagic);
    node.Start();
    REQUIRE(WaitFor([&] { return node.head_height() >= 2; }));
    node.Stop();

    auto block = node.GetBlock(1);
    REQUIRE(block.has_value());
    REQUIRE(block->header.inner_lite.timestamp_ms == 1700000000000);
}

TEST_CASE("ValidatorNode - round robin over three nodes", "[cluster][node]") {
    auto genesis = Genesis(3);
    Network net({genesis, genesis, genesis}, PassThrough());

    REQUIRE(WaitFor([&] {
        for (auto &node : net.nodes) {
            if (node->head_height() < 9) {
                return false;
            }
        }
        return true;
    }));

    // Stop before comparing so the chains are stable
    net.proxy.stop();
    for (auto &node : net.nodes) {
        node->Stop();
    }

    for (uint64_t h = 1; h <= 9; ++h) {
        auto a = net.nodes[0]->GetBlock(h);
        auto b = net.nodes[1]->GetBlock(h);
        auto c = net.nodes[2]->GetBlock(h);
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        REQUIRE(c.has_value());
        REQUIRE(a->GetHash() == b->GetHash());
        REQUIRE(b->GetHash() == c->GetHash());
        REQUIRE(a->header.inner_lite.producer == h % 3);
    }

    uint64_t produced = 0;
    for (auto &node : net.nodes) {
        produced += node->stats().produced;
        REQUIRE(node->peer_ids().size() == 2);
    }
    REQUIRE(produced >= 9);
    REQUIRE_FALSE(net.fault.has_fault());
}

TEST_CASE("ValidatorNode - lost blocks are recovered by catch-up", "[cluster][node]") {
    auto genesis = Genesis(2);
    // Every link loses its first five block messages
    Network net({genesis, genesis},
                [](int, int) { return std::make_unique<LossyBlockHandler>(5); });

    REQUIRE(WaitFor([&] {
        return net.nodes[0]->head_height() >= 8 && net.nodes[1]->head_height() >= 8;
    }));

    auto stats0 = net.nodes[0]->stats();
    auto stats1 = net.nodes[1]->stats();
    REQUIRE(stats0.requested + stats1.requested > 0);
    REQUIRE(stats0.served + stats1.served > 0);
    REQUIRE(net.proxy.total_stats().dropped == 10);
}

TEST_CASE("ValidatorNode - peers with another genesis are ignored", "[cluster][node]") {
    Network net({Genesis(2, 1000), Genesis(2, 2000)}, PassThrough());

    std::this_thread::sleep_for(400ms);

    // Height 1 belongs to node 1 and height 2 to node 0, so neither chain
    // can get past the first block without the other
    REQUIRE(net.nodes[0]->head_height() == 0);
    REQUIRE(net.nodes[1]->head_height() <= 1);
    REQUIRE(net.nodes[0]->stats().received == 0);
}

TEST_CASE("ValidatorNode - keep-alive pings are answered", "[cluster][node]") {
    auto genesis = Genesis(2);
    Network net({genesis, genesis}, PassThrough());

    REQUIRE(WaitFor([&] {
        return net.nodes[0]->stats().pongs > 0 && net.nodes[1]->stats().pongs > 0;
    }));
    REQUIRE(net.nodes[0]->stats().pings > 0);
}
