#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "common/configuration.h"

using namespace Skyvault;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        ::unsetenv("SKYVAULT_CONTAINER");
        ::unsetenv("SKYVAULT_SEGMENT_BYTES");
        ::unsetenv("SKYVAULT_METERING");
        Configuration::getInstance().reset();
    }

    void TearDown() override {
        SetUp();
    }

    Configuration& configuration() { return Configuration::getInstance(); }
};

TEST_F(ConfigurationTest, DefaultsAreValid) {
    EXPECT_TRUE(configuration().validate());
    EXPECT_EQ(configuration().getSegmentBytes(), kDefaultSegmentBytes);
    EXPECT_EQ(configuration().getDestinationDir(), "/tmp");
    EXPECT_EQ(configuration().config().tools.serializer.get(), "btrfs");
    EXPECT_TRUE(configuration().config().transfer.metering.get());
}

TEST_F(ConfigurationTest, LoadFromStringOverridesDefaults) {
    const std::string yaml = R"(
skyvault:
  store:
    root: /srv/objects
    container: home-backups
    segment_bytes: 2097152
  transfer:
    destination_dir: /var/tmp/skyvault
    crypto_recipient: age1example
    metering: false
    rate_limit: 20M
  tools:
    serializer: /usr/sbin/btrfs
  lineage:
    manifest: /etc/skyvault/home.yaml
  run:
    dry_run: true
    verbosity: 2
)";
    ASSERT_TRUE(configuration().loadFromString(yaml));

    const SkyvaultConfig& config = configuration().config();
    EXPECT_EQ(config.store.root.get(), "/srv/objects");
    EXPECT_EQ(configuration().getContainer(), "home-backups");
    EXPECT_EQ(configuration().getSegmentBytes(), 2097152u);
    EXPECT_EQ(config.transfer.crypto_recipient.get(), "age1example");
    EXPECT_FALSE(config.transfer.metering.get());
    EXPECT_EQ(config.transfer.rate_limit.get(), "20M");
    EXPECT_EQ(config.tools.serializer.get(), "/usr/sbin/btrfs");
    EXPECT_EQ(config.tools.encryptor.get(), "age");
    EXPECT_EQ(config.lineage.manifest.get(), "/etc/skyvault/home.yaml");
    EXPECT_TRUE(config.run.dry_run.get());
    EXPECT_EQ(config.run.verbosity.get(), 2);
}

TEST_F(ConfigurationTest, MissingTopLevelSectionKeepsDefaults) {
    EXPECT_TRUE(configuration().loadFromString("other:\n  key: value\n"));
    EXPECT_EQ(configuration().getContainer(), "");
}

TEST_F(ConfigurationTest, MalformedYamlIsRejected) {
    EXPECT_FALSE(configuration().loadFromString("skyvault: [unterminated"));
    EXPECT_FALSE(configuration().loadFromString("skyvault:\n  store:\n    segment_bytes: lots\n"));
}

TEST_F(ConfigurationTest, ValidationCollectsEveryError) {
    SkyvaultConfig& config = configuration().config();
    config.store.segment_bytes.set(1024);
    config.transfer.destination_dir.set("");
    config.transfer.crypto_recipient.set("age1example");
    config.tools.encryptor.set("");
    config.transfer.rate_limit.set("fast");

    EXPECT_FALSE(configuration().validate());
    EXPECT_EQ(configuration().getValidationErrors().size(), 4u);
}

TEST_F(ConfigurationTest, RateLimitFormats) {
    SkyvaultConfig& config = configuration().config();
    for (const char* ok : {"100", "1K", "20M", "1g"}) {
        config.transfer.rate_limit.set(ok);
        EXPECT_TRUE(configuration().validate()) << ok;
    }
    for (const char* bad : {"M", "1MB", "1.5M", "-1"}) {
        config.transfer.rate_limit.set(bad);
        EXPECT_FALSE(configuration().validate()) << bad;
    }
}

TEST_F(ConfigurationTest, MeterOnlyRequiredWhenMetering) {
    SkyvaultConfig& config = configuration().config();
    config.tools.meter.set("");
    EXPECT_FALSE(configuration().validate());
    config.transfer.metering.set(false);
    EXPECT_TRUE(configuration().validate());
}

TEST_F(ConfigurationTest, EnvironmentOverridesFileValues) {
    ASSERT_TRUE(configuration().loadFromString("skyvault:\n  store:\n    container: from-file\n"));
    EXPECT_EQ(configuration().getContainer(), "from-file");

    ::setenv("SKYVAULT_CONTAINER", "from-env", 1);
    ::setenv("SKYVAULT_SEGMENT_BYTES", "4194304", 1);
    ::setenv("SKYVAULT_METERING", "off", 1);
    EXPECT_EQ(configuration().getContainer(), "from-env");
    EXPECT_EQ(configuration().getSegmentBytes(), 4194304u);
    EXPECT_FALSE(configuration().config().transfer.metering.get());
}

TEST_F(ConfigurationTest, UnparsableEnvironmentValueIsIgnored) {
    ::setenv("SKYVAULT_SEGMENT_BYTES", "plenty", 1);
    ::setenv("SKYVAULT_METERING", "maybe", 1);
    EXPECT_EQ(configuration().getSegmentBytes(), kDefaultSegmentBytes);
    EXPECT_TRUE(configuration().config().transfer.metering.get());
}

TEST_F(ConfigurationTest, ResetRestoresDefaults) {
    configuration().config().store.container.set("changed");
    configuration().reset();
    EXPECT_EQ(configuration().getContainer(), "");
}
