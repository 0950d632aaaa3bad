#include "fitscore/config/presets.h"
#include "fitscore/matching/threshold_resolver.h"

#include <algorithm>

#include <catch2/catch_test_macros.hpp>

using namespace fitscore;

TEST_CASE("ThresholdResolver resolution order", "[matching][thresholds]") {
  const matching::ThresholdResolver resolver(config::default_threshold_table());

  SECTION("explicit token entry wins and keeps its group") {
    const auto r = resolver.resolve("Java");
    REQUIRE(r.threshold == 0.72);
    REQUIRE(r.source == matching::ThresholdSource::kToken);
    REQUIRE(r.group == "jvm_backend");
  }

  SECTION("group default applies to members without an entry") {
    const auto r = resolver.resolve("kotlin");
    REQUIRE(r.threshold == 0.7);
    REQUIRE(r.source == matching::ThresholdSource::kGroupDefault);
    REQUIRE(r.group == "jvm_backend");
  }

  SECTION("unknown token falls back to the global default") {
    const auto r = resolver.resolve("haskell");
    REQUIRE(r.threshold == 0.6);
    REQUIRE(r.source == matching::ThresholdSource::kGlobal);
    REQUIRE_FALSE(r.group.has_value());
  }
}

TEST_CASE("Group without a threshold resolves globally but keeps membership",
          "[matching][thresholds]") {
  config::ThresholdTable table;
  table.global_default = 0.55;
  table.groups.push_back(config::ConflictGroup{"queues", {"kafka", "rabbitmq"}, std::nullopt});

  const matching::ThresholdResolver resolver(table);
  const auto r = resolver.resolve("kafka");
  REQUIRE(r.threshold == 0.55);
  REQUIRE(r.source == matching::ThresholdSource::kGlobal);
  REQUIRE(r.group == "queues");
}

TEST_CASE("Conflict group veto", "[matching][thresholds][veto]") {
  const matching::ThresholdResolver resolver(config::default_threshold_table());

  SECTION("different groups without a mention veto") {
    REQUIRE(resolver.should_veto("java", std::string{"python"}, false));
  }

  SECTION("lexical mention lifts the veto") {
    REQUIRE_FALSE(resolver.should_veto("java", std::string{"python"}, true));
  }

  SECTION("same group never vetoes") {
    REQUIRE_FALSE(resolver.should_veto("java", std::string{"kotlin"}, false));
  }

  SECTION("ungrouped tokens never veto") {
    REQUIRE_FALSE(resolver.should_veto("haskell", std::string{"python"}, false));
    REQUIRE_FALSE(resolver.should_veto("java", std::string{"docker"}, false));
    REQUIRE_FALSE(resolver.should_veto("java", std::nullopt, false));
  }
}

TEST_CASE("vocabulary lists every table token", "[matching][thresholds]") {
  const matching::ThresholdResolver resolver(config::default_threshold_table());
  const auto vocab = resolver.vocabulary();

  REQUIRE(std::find(vocab.begin(), vocab.end(), "sql") != vocab.end());
  REQUIRE(std::find(vocab.begin(), vocab.end(), "laravel") != vocab.end());
  REQUIRE(matching::to_string(matching::ThresholdSource::kGroupDefault) == "group_default");
}

TEST_CASE("Entries written under an alias apply to the canonical token",
          "[matching][thresholds][synonyms]") {
  config::ThresholdTable table;
  table.token_thresholds = {{"k8s", 0.99}};
  table.groups.push_back(config::ConflictGroup{"go_stack", {"golang"}, std::nullopt});
  table.groups.push_back(config::ConflictGroup{"jvm", {"java"}, std::nullopt});

  const matching::ThresholdResolver resolver(table, config::default_synonym_table());

  const auto kube = resolver.resolve("kubernetes");
  REQUIRE(kube.threshold == 0.99);
  REQUIRE(kube.source == matching::ThresholdSource::kToken);
  REQUIRE(resolver.resolve("K8s").threshold == 0.99);

  REQUIRE(resolver.group_of("go") == "go_stack");
  REQUIRE(resolver.should_veto("go", std::string{"java"}, false));

  const auto vocab = resolver.vocabulary();
  REQUIRE(std::find(vocab.begin(), vocab.end(), "kubernetes") != vocab.end());
  REQUIRE(std::find(vocab.begin(), vocab.end(), "k8s") == vocab.end());
}
