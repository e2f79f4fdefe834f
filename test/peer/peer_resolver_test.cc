#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "common/errors.h"
#include "fakes/fake_cluster.h"
#include "peer/peer_descriptor.h"
#include "peer/peer_resolver.h"

using namespace VerifyRep;
using VerifyRep::fakes::FakePeerRegistry;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

TEST(ClusterKeyTest, ParsesQuorumPortAndParent) {
    ClusterKey key;
    ASSERT_TRUE(ClusterKey::Parse("zk1,zk2,zk3:2181:/hbase", &key));
    EXPECT_THAT(key.quorum, ElementsAre("zk1", "zk2", "zk3"));
    EXPECT_EQ(key.port, 2181);
    EXPECT_EQ(key.znode_parent, "/hbase");
    EXPECT_EQ(key.ToString(), "zk1,zk2,zk3:2181:/hbase");
}

TEST(ClusterKeyTest, ParentMayContainColons) {
    ClusterKey key;
    ASSERT_TRUE(ClusterKey::Parse("zk1:2181:/hbase:secure", &key));
    EXPECT_EQ(key.znode_parent, "/hbase:secure");
}

TEST(ClusterKeyTest, RejectsMalformedKeys) {
    ClusterKey key;
    EXPECT_FALSE(ClusterKey::Parse("", &key));
    EXPECT_FALSE(ClusterKey::Parse("zk1", &key));
    EXPECT_FALSE(ClusterKey::Parse("zk1:2181", &key));
    EXPECT_FALSE(ClusterKey::Parse(":2181:/hbase", &key));
    EXPECT_FALSE(ClusterKey::Parse("zk1:port:/hbase", &key));
    EXPECT_FALSE(ClusterKey::Parse("zk1:0:/hbase", &key));
    EXPECT_FALSE(ClusterKey::Parse("zk1:70000:/hbase", &key));
    EXPECT_FALSE(ClusterKey::Parse("zk1:2181:hbase", &key));
}

class PeerResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        PeerConfig config;
        config.cluster_key = "zk1,zk2:2181:/hbase";
        config.scan_endpoints = {"rs1:16020", "rs2:16020"};
        config.security_context = "token";
        registry_.AddPeer("2", config);
    }

    FakePeerRegistry registry_;
};

TEST_F(PeerResolverTest, ResolvesRegisteredPeer) {
    PeerResolver resolver(registry_);
    PeerDescriptor peer = resolver.Resolve("2");

    EXPECT_EQ(peer.peer_id, "2");
    EXPECT_EQ(peer.cluster_key, "zk1,zk2:2181:/hbase");
    EXPECT_EQ(peer.znode_parent, "/hbase");
    // Scans go to the region servers, never to the metadata quorum
    EXPECT_THAT(peer.endpoints, ElementsAre("rs1:16020", "rs2:16020"));
    EXPECT_EQ(peer.security_context, "token");
    EXPECT_TRUE(peer.enabled);

    EXPECT_EQ(registry_.connects(), 1);
    EXPECT_EQ(registry_.open_connections(), 0);
}

TEST_F(PeerResolverTest, UnknownPeerIsNotFound) {
    PeerResolver resolver(registry_);
    try {
        resolver.Resolve("7");
        FAIL() << "Expected PeerNotFound";
    } catch (const PeerNotFound& e) {
        EXPECT_EQ(e.peer_id(), "7");
        EXPECT_THAT(e.what(), HasSubstr("Couldn't get peer conf for peer 7"));
    }
    EXPECT_EQ(registry_.open_connections(), 0);
}

TEST_F(PeerResolverTest, UnreachableRegistryIsMetadataUnavailable) {
    registry_.SetUnavailable(true);
    PeerResolver resolver(registry_);
    EXPECT_THROW(resolver.Resolve("2"), MetadataUnavailable);
    EXPECT_EQ(registry_.open_connections(), 0);
}

TEST_F(PeerResolverTest, FailedLookupReleasesConnection) {
    registry_.FailLookups(true);
    PeerResolver resolver(registry_);
    EXPECT_THROW(resolver.Resolve("2"), MetadataUnavailable);
    EXPECT_EQ(registry_.connects(), 1);
    EXPECT_EQ(registry_.open_connections(), 0);
}

TEST_F(PeerResolverTest, MalformedClusterKeyIsMetadataUnavailable) {
    PeerConfig config;
    config.cluster_key = "not-a-cluster-key";
    config.scan_endpoints = {"rs1:16020"};
    registry_.AddPeer("3", config);

    PeerResolver resolver(registry_);
    EXPECT_THROW(resolver.Resolve("3"), MetadataUnavailable);
    EXPECT_EQ(registry_.open_connections(), 0);
}

TEST_F(PeerResolverTest, DisabledPeerStillResolves) {
    PeerConfig config;
    config.cluster_key = "zk9:2181:/hbase";
    config.scan_endpoints = {"rs9:16020"};
    config.enabled = false;
    registry_.AddPeer("4", config);

    PeerResolver resolver(registry_);
    PeerDescriptor peer = resolver.Resolve("4");
    EXPECT_FALSE(peer.enabled);
    EXPECT_THAT(peer.endpoints, ElementsAre("rs9:16020"));
}

TEST_F(PeerResolverTest, PeerWithoutScanEndpointsIsMetadataUnavailable) {
    PeerConfig config;
    config.cluster_key = "zk5:2181:/hbase";
    registry_.AddPeer("5", config);

    PeerResolver resolver(registry_);
    EXPECT_THROW(resolver.Resolve("5"), MetadataUnavailable);
    EXPECT_EQ(registry_.open_connections(), 0);
}
