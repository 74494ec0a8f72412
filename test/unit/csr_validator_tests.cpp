// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for the serving-certificate address cross-check

#include <catch2/catch_test_macros.hpp>
#include "cloud/csr_validator.hpp"
#include "infra/flaky_node_registry.hpp"
#include "util/time.hpp"

using namespace nodeguard;
using namespace nodeguard::cloud;
using namespace std::chrono_literals;
using boost::asio::ip::make_address;
using node::Node;
using node::NodeAddressType;

namespace {

std::vector<Node> TestNodes() {
    Node node1;
    node1.name = "node1";

    Node node2;
    node2.name = "node2";
    node2.annotations[node::kProvidedIPAnnotation] = "1.2.3.4";

    Node node_int;
    node_int.name = "node-int";
    node_int.annotations[node::kProvidedIPAnnotation] = "1.2.3.4";
    node_int.addresses = {{NodeAddressType::INTERNAL_IP, "1.2.3.4"}};

    Node node_int_ext;
    node_int_ext.name = "node-int-ext";
    node_int_ext.annotations[node::kProvidedIPAnnotation] = "1.2.3.4";
    node_int_ext.addresses = {
        {NodeAddressType::INTERNAL_IP, "1.2.3.4"},
        {NodeAddressType::EXTERNAL_IP, "2000::1"},
    };

    Node node_host;
    node_host.name = "node-host";
    node_host.addresses = {
        {NodeAddressType::HOSTNAME, "5.6.7.8"},
        {NodeAddressType::INTERNAL_IP, "not-an-address"},
        {NodeAddressType::EXTERNAL_IP, "2001:DB8::0:1"},
    };

    return {node1, node2, node_int, node_int_ext, node_host};
}

CertificateRequest Request(const std::string& dns, const std::vector<std::string>& ips = {}) {
    CertificateRequest request;
    request.dns_names.push_back(dns);
    for (const auto& ip : ips) {
        request.ip_addresses.push_back(make_address(ip));
    }
    return request;
}

TrustDecision Evaluate(node::NodeRegistry& registry, const CertificateRequest& request,
                       util::Status& status) {
    util::Context ctx;
    bool approve = EvaluateNodeCSR(ctx, registry, request, status);
    return ToTrustDecision(approve, status);
}

} // namespace

TEST_CASE("EvaluateNodeCSR - node address cases", "[cloud][csr]") {
    node::MemoryNodeRegistry registry(TestNodes());
    util::Status status;

    SECTION("Unknown node is an error, not a denial") {
        util::Context ctx;
        bool approve = EvaluateNodeCSR(ctx, registry, Request("node-non-existing"), status);
        REQUIRE_FALSE(approve);
        REQUIRE(status.IsNotFound());
        REQUIRE(status.message() ==
                "failed to get node node-non-existing: nodes \"node-non-existing\" not found");
        REQUIRE(ToTrustDecision(approve, status) == TrustDecision::ERROR);
    }

    SECTION("DNS-only request on a node without addresses") {
        REQUIRE(Evaluate(registry, Request("node1"), status) == TrustDecision::APPROVE);
        REQUIRE(Evaluate(registry, Request("node2"), status) == TrustDecision::APPROVE);
    }

    SECTION("Provided node IP is trusted") {
        REQUIRE(Evaluate(registry, Request("node2", {"1.2.3.4"}), status) == TrustDecision::APPROVE);
    }

    SECTION("Unrecorded IP is denied") {
        REQUIRE(Evaluate(registry, Request("node2", {"1.2.3.4", "2000::1"}), status) ==
                TrustDecision::DENY);
        REQUIRE(status.IsOk());
        REQUIRE(Evaluate(registry, Request("node1", {"1.2.3.4"}), status) == TrustDecision::DENY);
    }

    SECTION("Internal address") {
        REQUIRE(Evaluate(registry, Request("node-int", {"1.2.3.4"}), status) ==
                TrustDecision::APPROVE);
        REQUIRE(Evaluate(registry, Request("node-int", {"2000::1"}), status) ==
                TrustDecision::DENY);
    }

    SECTION("Internal and external addresses") {
        REQUIRE(Evaluate(registry, Request("node-int-ext", {"1.2.3.4", "2000::1"}), status) ==
                TrustDecision::APPROVE);
        REQUIRE(Evaluate(registry, Request("node-int-ext", {"2000::1"}), status) ==
                TrustDecision::APPROVE);
    }

    SECTION("Any single mismatch denies") {
        REQUIRE(Evaluate(registry, Request("node-int-ext", {"1.2.3.4", "2000::1", "9.9.9.9"}),
                         status) == TrustDecision::DENY);
    }

    SECTION("Only the first DNS name identifies the node") {
        auto request = Request("node-int", {"1.2.3.4"});
        request.dns_names.push_back("node-non-existing");
        REQUIRE(Evaluate(registry, request, status) == TrustDecision::APPROVE);
    }
}

TEST_CASE("EvaluateNodeCSR - equivalent representations", "[cloud][csr]") {
    node::MemoryNodeRegistry registry(TestNodes());
    util::Status status;

    SECTION("IPv4-mapped SAN matches IPv4 record") {
        REQUIRE(Evaluate(registry, Request("node-int", {"::ffff:1.2.3.4"}), status) ==
                TrustDecision::APPROVE);
    }

    SECTION("Full-form IPv6 SAN matches compressed record") {
        REQUIRE(Evaluate(registry, Request("node-int-ext", {"2000:0:0:0:0:0:0:1"}), status) ==
                TrustDecision::APPROVE);
    }

    SECTION("Uppercase record matches compressed SAN") {
        REQUIRE(Evaluate(registry, Request("node-host", {"2001:db8::1"}), status) ==
                TrustDecision::APPROVE);
    }

    SECTION("Hostname entries are not addresses") {
        REQUIRE(Evaluate(registry, Request("node-host", {"5.6.7.8"}), status) ==
                TrustDecision::DENY);
    }
}

TEST_CASE("EvaluateNodeCSR - request without DNS names", "[cloud][csr]") {
    node::MemoryNodeRegistry registry(TestNodes());
    CertificateRequest request;
    request.ip_addresses.push_back(make_address("1.2.3.4"));

    util::Status status;
    REQUIRE(Evaluate(registry, request, status) == TrustDecision::ERROR);
    REQUIRE(status.IsValidation());
}

TEST_CASE("EvaluateNodeCSR - lookup failures are errors", "[cloud][csr]") {
    node::MemoryNodeRegistry inner(TestNodes());
    node::FlakyNodeRegistry registry(inner);
    util::Status status;

    SECTION("Canceled context") {
        util::Context ctx;
        ctx.Cancel();
        bool approve = EvaluateNodeCSR(ctx, registry, Request("node-int", {"1.2.3.4"}), status);
        REQUIRE_FALSE(approve);
        REQUIRE(status.IsTransient());
        REQUIRE(status.message() == "failed to get node node-int: context canceled");
    }

    SECTION("Expired deadline") {
        util::MockTimeScope mock(1000);
        auto ctx = util::Context::WithTimeout(1s);
        util::SetMockTime(1005);
        bool approve = EvaluateNodeCSR(ctx, registry, Request("node-int", {"9.9.9.9"}), status);
        REQUIRE(ToTrustDecision(approve, status) == TrustDecision::ERROR);
        REQUIRE(status.message() == "failed to get node node-int: context deadline exceeded");
    }

    SECTION("Unresponsive backend times out as an error") {
        registry.SetUnresponsive(true);
        auto ctx = util::Context::WithTimeout(30ms);
        bool approve = EvaluateNodeCSR(ctx, registry, Request("node-int", {"9.9.9.9"}), status);
        REQUIRE(ToTrustDecision(approve, status) == TrustDecision::ERROR);
        REQUIRE(status.IsTransient());
    }

    SECTION("Backend error") {
        registry.FailNextGets(1, util::Status::Transient("connection refused"));
        util::Context ctx;
        bool approve = EvaluateNodeCSR(ctx, registry, Request("node-int"), status);
        REQUIRE_FALSE(approve);
        REQUIRE(status.message() == "failed to get node node-int: connection refused");
        REQUIRE(registry.get_calls() == 1);
    }
}

TEST_CASE("TrustDecision helpers", "[cloud][csr]") {
    REQUIRE(ToTrustDecision(true, util::Status::Ok()) == TrustDecision::APPROVE);
    REQUIRE(ToTrustDecision(false, util::Status::Ok()) == TrustDecision::DENY);
    REQUIRE(ToTrustDecision(false, util::Status::Transient("x")) == TrustDecision::ERROR);
    // An error never approves, whatever the flag says
    REQUIRE(ToTrustDecision(true, util::Status::NotFound("x")) == TrustDecision::ERROR);

    REQUIRE(std::string(TrustDecisionName(TrustDecision::DENY)) == "deny");
}

TEST_CASE("RecordedNodeIPs", "[cloud][csr]") {
    Node node;
    node.name = "n";
    node.addresses = {
        {NodeAddressType::INTERNAL_IP, "::ffff:10.0.0.1"},
        {NodeAddressType::EXTERNAL_IP, "2001:db8::1"},
        {NodeAddressType::HOSTNAME, "10.9.9.9"},
    };
    node.annotations[node::kProvidedIPAnnotation] = "10.0.0.2";

    auto ips = RecordedNodeIPs(node);
    REQUIRE(ips.size() == 3);
    REQUIRE(ips.count(make_address("10.0.0.1")) == 1);
    REQUIRE(ips.count(make_address("10.0.0.2")) == 1);
    REQUIRE(ips.count(make_address("2001:db8::1")) == 1);
}
