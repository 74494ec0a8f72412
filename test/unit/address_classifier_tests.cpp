// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for node address classification

#include <catch2/catch_test_macros.hpp>
#include "cloud/address_classifier.hpp"
#include <algorithm>
#include <numeric>
#include <thread>

using namespace nodeguard;
using namespace nodeguard::cloud;
using node::NodeAddress;
using node::NodeAddressType;

namespace {

std::vector<ObservedAddress> Observed(const std::vector<std::string>& texts) {
    std::vector<ObservedAddress> out;
    for (const auto& text : texts) {
        auto parsed = ParseObservedAddress(text);
        REQUIRE(parsed.has_value());
        out.push_back(*parsed);
    }
    return out;
}

NodeAddress Internal(const std::string& ip) { return {NodeAddressType::INTERNAL_IP, ip}; }
NodeAddress External(const std::string& ip) { return {NodeAddressType::EXTERNAL_IP, ip}; }

std::vector<NodeAddress> Classify(const PlatformPolicy& policy,
                                  const std::vector<ObservedAddress>& observed) {
    util::Status status;
    auto result = ClassifyNodeAddresses(policy, observed, status);
    REQUIRE(status.IsOk());
    return result;
}

// Addresses reported by a typical dual-stack host behind a private network
const std::vector<std::string> kManyPublicIPs = {
    "192.168.0.1/24",
    "fe80::e0b5:71ff:fe24:7e60/64",
    "fd15:1:2::192:168:0:1/64",
    "1.2.3.4/24",
    "4.3.2.1/24",
    "2001:1234::1/64",
    "2001:1234:4321::32/64",
};

} // namespace

TEST_CASE("ClassifyNodeAddresses - platform cases", "[cloud][address]") {
    SECTION("nocloud without public addresses") {
        PlatformPolicy policy{"nocloud", false, "192.168.0.1"};
        auto observed = Observed({
            "192.168.0.1/24",
            "fe80::e0b5:71ff:fe24:7e60/64",
            "fd15:1:2::192:168:0:1/64",
            "fd43:fe8a:be2:ab02:dc3c:38ff:fe51:5022/64@kubespan",
        });
        REQUIRE(Classify(policy, observed) == std::vector<NodeAddress>{Internal("192.168.0.1")});
    }

    SECTION("nocloud with many public addresses") {
        PlatformPolicy policy{"nocloud", false, "192.168.0.1"};
        REQUIRE(Classify(policy, Observed(kManyPublicIPs)) == std::vector<NodeAddress>{
                    Internal("192.168.0.1"),
                    External("1.2.3.4"),
                    External("2001:1234:4321::32"),
                });
    }

    SECTION("nocloud with many public addresses, IPv6 preferred") {
        PlatformPolicy policy{"nocloud", true, "192.168.0.1"};
        REQUIRE(Classify(policy, Observed(kManyPublicIPs)) == std::vector<NodeAddress>{
                    Internal("192.168.0.1"),
                    External("2001:1234:4321::32"),
                    External("1.2.3.4"),
                });
    }

    SECTION("metal promotes public addresses") {
        PlatformPolicy policy{"metal", false, "192.168.0.1"};
        auto observed = Observed({
            "192.168.0.1/24",
            "fe80::e0b5:71ff:fe24:7e60/64",
            "fd15:1:2::192:168:0:1/64",
            "1.2.3.4/24",
            "2001:1234::1/128",
        });
        REQUIRE(Classify(policy, observed) == std::vector<NodeAddress>{
                    Internal("192.168.0.1"),
                    External("1.2.3.4"),
                    External("2001:1234::1"),
                });
    }

    SECTION("managed cloud only promotes the external link") {
        PlatformPolicy policy{"gcp", false, "192.168.0.1"};
        auto observed = Observed({
            "192.168.0.1/24",
            "fe80::e0b5:71ff:fe24:7e60/64",
            "1.2.3.4/24@external",
            "4.3.2.1/24",
            "2001:1234::1/128@external",
            "2001:1234::123/64",
        });
        REQUIRE(Classify(policy, observed) == std::vector<NodeAddress>{
                    Internal("192.168.0.1"),
                    External("1.2.3.4"),
                    External("2001:1234::1"),
                });
    }

    SECTION("managed cloud with no external link has no ExternalIP") {
        PlatformPolicy policy{"aws", false, "10.0.0.7"};
        auto observed = Observed({"10.0.0.7/16@eth0", "3.3.3.3/32@eth0"});
        REQUIRE(Classify(policy, observed) == std::vector<NodeAddress>{Internal("10.0.0.7")});
    }

    SECTION("managed cloud accepts a private address on the external link") {
        PlatformPolicy policy{"openstack", false, ""};
        auto observed = Observed({"10.20.0.5/24@external"});
        REQUIRE(Classify(policy, observed) == std::vector<NodeAddress>{External("10.20.0.5")});
    }
}

TEST_CASE("ClassifyNodeAddresses - edge cases", "[cloud][address]") {
    SECTION("Empty input") {
        PlatformPolicy policy{"metal", false, ""};
        REQUIRE(Classify(policy, {}).empty());
    }

    SECTION("No provided IP means no InternalIP") {
        PlatformPolicy policy{"metal", false, ""};
        auto observed = Observed({"10.0.0.1/8", "5.6.7.8/24"});
        REQUIRE(Classify(policy, observed) == std::vector<NodeAddress>{External("5.6.7.8")});
    }

    SECTION("Provided IP without observed addresses") {
        PlatformPolicy policy{"metal", false, "2001:db8::10"};
        REQUIRE(Classify(policy, {}) == std::vector<NodeAddress>{Internal("2001:db8::10")});
    }

    SECTION("Invalid provided IP") {
        PlatformPolicy policy{"metal", false, "not-an-ip"};
        util::Status status;
        auto result = ClassifyNodeAddresses(policy, Observed({"1.2.3.4/24"}), status);
        REQUIRE(status.IsValidation());
        REQUIRE(status.message() == "invalid node IP \"not-an-ip\"");
        REQUIRE(result.empty());
    }

    SECTION("Provided IP is never also External") {
        PlatformPolicy policy{"metal", false, "1.2.3.4"};
        auto observed = Observed({"1.2.3.4/24", "1.2.3.4/32@external"});
        REQUIRE(Classify(policy, observed) == std::vector<NodeAddress>{Internal("1.2.3.4")});
    }

    SECTION("Loopback and link-local are never External") {
        for (const char* platform : {"metal", "gcp"}) {
            PlatformPolicy policy{platform, false, ""};
            auto observed = Observed({
                "127.0.0.1/8@external",
                "::1/128@external",
                "169.254.10.1/16@external",
                "fe80::1/64@external",
                "0.0.0.0/0@external",
            });
            REQUIRE(Classify(policy, observed).empty());
        }
    }

    SECTION("Overlay and mesh links are excluded") {
        PlatformPolicy policy{"metal", false, ""};
        auto observed = Observed({
            "5.5.5.1/32@kubespan",
            "5.5.5.2/32@siderolink",
            "5.5.5.3/32@lo",
            "5.5.5.4/32@cilium_host",
            "5.5.5.5/32@dummy0",
            "2001:db8::5/128@dummy-ext",
        });
        REQUIRE(Classify(policy, observed).empty());
    }

    SECTION("IPv4-mapped addresses are treated as IPv4") {
        PlatformPolicy policy{"metal", false, "::ffff:192.168.0.1"};
        auto observed = Observed({"::ffff:192.168.0.1/120", "::ffff:8.8.4.4/120"});
        REQUIRE(Classify(policy, observed) == std::vector<NodeAddress>{
                    Internal("192.168.0.1"),
                    External("8.8.4.4"),
                });
    }

    SECTION("Single family") {
        PlatformPolicy policy{"metal", true, ""};
        auto observed = Observed({"1.2.3.4/24"});
        REQUIRE(Classify(policy, observed) == std::vector<NodeAddress>{External("1.2.3.4")});
    }
}

TEST_CASE("ClassifyNodeAddresses - independent of input order", "[cloud][address]") {
    PlatformPolicy policy{"nocloud", false, "192.168.0.1"};
    const auto observed = Observed(kManyPublicIPs);
    const auto expected = Classify(policy, observed);

    std::vector<size_t> order(observed.size());
    std::iota(order.begin(), order.end(), 0);

    int permutations = 0;
    do {
        std::vector<ObservedAddress> permuted;
        for (size_t i : order) {
            permuted.push_back(observed[i]);
        }
        util::Status status;
        auto result = ClassifyNodeAddresses(policy, permuted, status);
        REQUIRE(status.IsOk());
        REQUIRE(result == expected);
        ++permutations;
    } while (std::next_permutation(order.begin(), order.end()));

    REQUIRE(permutations == 5040);
}

TEST_CASE("ClassifyNodeAddresses - concurrent callers", "[cloud][address][threading]") {
    PlatformPolicy policy{"metal", false, "192.168.0.1"};
    const auto observed = Observed(kManyPublicIPs);
    const auto expected = Classify(policy, observed);

    constexpr int kThreads = 8;
    std::vector<std::vector<NodeAddress>> results(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i]() {
            util::Status status;
            for (int n = 0; n < 100; ++n) {
                results[i] = ClassifyNodeAddresses(policy, observed, status);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    for (const auto& result : results) {
        REQUIRE(result == expected);
    }
}

TEST_CASE("ParseObservedAddress", "[cloud][address]") {
    SECTION("Address with link") {
        auto parsed = ParseObservedAddress("1.2.3.4/24@eth0");
        REQUIRE(parsed.has_value());
        REQUIRE(parsed->address.ToString() == "1.2.3.4/24");
        REQUIRE(parsed->link_name == "eth0");
    }

    SECTION("Address without link or length") {
        auto parsed = ParseObservedAddress("2001:db8::1");
        REQUIRE(parsed.has_value());
        REQUIRE(parsed->address.prefix_length == 128);
        REQUIRE(parsed->link_name.empty());
    }

    SECTION("Invalid address part") {
        REQUIRE_FALSE(ParseObservedAddress("nope@eth0").has_value());
        REQUIRE_FALSE(ParseObservedAddress("1.2.3.4/40@eth0").has_value());
        REQUIRE_FALSE(ParseObservedAddress("").has_value());
    }
}

TEST_CASE("Link and platform policy helpers", "[cloud][address]") {
    REQUIRE(IsExcludedLink("kubespan"));
    REQUIRE(IsExcludedLink("siderolink"));
    REQUIRE(IsExcludedLink("lo"));
    REQUIRE(IsExcludedLink("cilium_host"));
    REQUIRE(IsExcludedLink("dummy0"));
    REQUIRE_FALSE(IsExcludedLink("eth0"));
    REQUIRE_FALSE(IsExcludedLink("external"));
    REQUIRE_FALSE(IsExcludedLink("lo0"));
    REQUIRE_FALSE(IsExcludedLink(""));

    REQUIRE(PromotesUnlabeledAddresses("metal"));
    REQUIRE(PromotesUnlabeledAddresses("nocloud"));
    REQUIRE_FALSE(PromotesUnlabeledAddresses("aws"));
    REQUIRE_FALSE(PromotesUnlabeledAddresses(""));
}
