#include <catch2/catch_test_macros.hpp>

#include <docfed/mapping/schema_mapping.hpp>

using namespace docfed;

namespace {

SchemaMapping CustomerMapping() {
    SchemaMapping m;
    m.id = 1;
    m.name = "users-to-customers";
    m.source = {1, "users"};
    m.target = {1, "customers"};
    m.rules = {
        {"uid", "customer_id", RuleKind::Direct, ""},
        {"name", "display_name", RuleKind::Transform, "toUpperCase"},
    };
    return m;
}

} // anonymous namespace

// ===========================================================================
// Tokens
// ===========================================================================

TEST_CASE("ParseRuleKind and RuleKindName", "[mapping]") {
    for (auto kind : {RuleKind::Direct, RuleKind::Transform, RuleKind::Custom}) {
        CHECK(ParseRuleKind(RuleKindName(kind)).Value() == kind);
    }
    auto bad = ParseRuleKind("copy");
    REQUIRE(bad.IsErr());
    CHECK(bad.Error().category == ErrorCategory::Config);
}

TEST_CASE("ParseMappingStatus and MappingStatusName", "[mapping]") {
    CHECK(ParseMappingStatus("active").Value() == MappingStatus::Active);
    CHECK(ParseMappingStatus("inactive").Value() == MappingStatus::Inactive);
    CHECK(std::string(MappingStatusName(MappingStatus::Inactive)) == "inactive");
    CHECK(ParseMappingStatus("Active").IsErr());
}

// ===========================================================================
// ApplyMapping
// ===========================================================================

TEST_CASE("ApplyMapping: direct and transform rules", "[mapping][apply]") {
    TransformRegistry transforms;
    Rows rows{Row{{"uid", Value("1")}, {"name", Value("Ann")}, {"age", Value(30)}}};

    auto mapped = ApplyMapping(rows, CustomerMapping(), MappingDirection::SourceToTarget,
                               transforms);
    REQUIRE(mapped.size() == 1);
    CHECK(mapped[0].Size() == 2);
    CHECK(*mapped[0].Find("customer_id") == Value("1"));
    CHECK(*mapped[0].Find("display_name") == Value("ANN"));
    CHECK_FALSE(mapped[0].Contains("age"));
}

TEST_CASE("ApplyMapping: absent source fields are omitted", "[mapping][apply]") {
    TransformRegistry transforms;
    Rows rows{Row{{"uid", Value("2")}}};
    auto mapped = ApplyMapping(rows, CustomerMapping(), MappingDirection::SourceToTarget,
                               transforms);
    REQUIRE(mapped.size() == 1);
    CHECK(mapped[0].Size() == 1);
    CHECK_FALSE(mapped[0].Contains("display_name"));
}

TEST_CASE("ApplyMapping: no rules returns rows unchanged", "[mapping][apply]") {
    TransformRegistry transforms;
    auto mapping = CustomerMapping();
    mapping.rules.clear();
    Rows rows{Row{{"uid", Value("1")}}};
    CHECK(ApplyMapping(rows, mapping, MappingDirection::SourceToTarget, transforms) == rows);
}

TEST_CASE("ApplyMapping: reverse direction copies target back to source", "[mapping][apply]") {
    TransformRegistry transforms;
    Rows rows{Row{{"customer_id", Value("1")}, {"display_name", Value("ANN")}}};
    auto mapped = ApplyMapping(rows, CustomerMapping(), MappingDirection::TargetToSource,
                               transforms);
    REQUIRE(mapped.size() == 1);
    CHECK(*mapped[0].Find("uid") == Value("1"));
    CHECK(*mapped[0].Find("name") == Value("ANN"));
}

TEST_CASE("ApplyMapping: unknown transform warns once per rule", "[mapping][apply]") {
    TransformRegistry transforms;
    auto mapping = CustomerMapping();
    mapping.rules[1].transform = "reverse";
    Rows rows{Row{{"name", Value("Ann")}}, Row{{"name", Value("Bob")}}};

    std::vector<Error> warnings;
    auto mapped = ApplyMapping(rows, mapping, MappingDirection::SourceToTarget, transforms,
                               &warnings);
    REQUIRE(mapped.size() == 2);
    CHECK(*mapped[1].Find("display_name") == Value("Bob"));
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].category == ErrorCategory::MappingSynthesis);
    CHECK(warnings[0].target == "users-to-customers");
    REQUIRE(warnings[0].detail.has_value());
    CHECK(warnings[0].detail->find("toUpperCase") != std::string::npos);
}

TEST_CASE("ApplyMapping: custom rule uses a registered transform", "[mapping][apply]") {
    TransformRegistry transforms;
    transforms.Register("initial", [](const Value& v) {
        return v.IsString() && !v.AsString().empty() ? Value(v.AsString().substr(0, 1)) : v;
    });
    auto mapping = CustomerMapping();
    mapping.rules[1] = {"name", "initial", RuleKind::Custom, "initial"};

    std::vector<Error> warnings;
    auto mapped = ApplyMapping({Row{{"name", Value("Ann")}}}, mapping,
                               MappingDirection::SourceToTarget, transforms, &warnings);
    CHECK(*mapped[0].Find("initial") == Value("A"));
    CHECK(warnings.empty());
}

TEST_CASE("ApplyMapping: custom rule without a registered transform copies", "[mapping][apply]") {
    TransformRegistry transforms;
    auto mapping = CustomerMapping();
    mapping.rules[1] = {"name", "label", RuleKind::Custom, "missing"};

    std::vector<Error> warnings;
    auto mapped = ApplyMapping({Row{{"name", Value("Ann")}}}, mapping,
                               MappingDirection::SourceToTarget, transforms, &warnings);
    CHECK(*mapped[0].Find("label") == Value("Ann"));
    CHECK(warnings.empty());
}

// ===========================================================================
// SynthesizeCollections
// ===========================================================================

TEST_CASE("SynthesizeCollections: derives a missing target", "[mapping][synthesize]") {
    TransformRegistry transforms;
    CollectionMap available{{"users", {Row{{"uid", Value("1")}, {"name", Value("Ann")}}}}};

    auto derived = SynthesizeCollections({CustomerMapping()}, available, transforms);
    REQUIRE(derived.count("customers") == 1);
    CHECK(*derived["customers"][0].Find("display_name") == Value("ANN"));
    CHECK(available.size() == 1);
}

TEST_CASE("SynthesizeCollections: existing target is not replaced", "[mapping][synthesize]") {
    TransformRegistry transforms;
    CollectionMap available{{"users", {Row{{"uid", Value("1")}}}},
                            {"customers", {Row{{"customer_id", Value("9")}}}}};
    CHECK(SynthesizeCollections({CustomerMapping()}, available, transforms).empty());
}

TEST_CASE("SynthesizeCollections: skips inactive mappings and missing sources",
          "[mapping][synthesize]") {
    TransformRegistry transforms;
    auto inactive = CustomerMapping();
    inactive.status = MappingStatus::Inactive;
    CollectionMap available{{"users", {Row{{"uid", Value("1")}}}}};
    CHECK(SynthesizeCollections({inactive}, available, transforms).empty());
    CHECK(SynthesizeCollections({CustomerMapping()}, CollectionMap{}, transforms).empty());
}

TEST_CASE("SynthesizeCollections: first mapping for a target wins", "[mapping][synthesize]") {
    TransformRegistry transforms;
    auto first = CustomerMapping();
    auto second = CustomerMapping();
    second.id = 2;
    second.rules = {{"uid", "other_id", RuleKind::Direct, ""}};
    CollectionMap available{{"users", {Row{{"uid", Value("1")}}}}};

    auto derived = SynthesizeCollections({first, second}, available, transforms);
    REQUIRE(derived.size() == 1);
    CHECK(derived["customers"][0].Contains("customer_id"));
    CHECK_FALSE(derived["customers"][0].Contains("other_id"));
}

TEST_CASE("SynthesizeCollections: repeated synthesis yields identical output",
          "[mapping][synthesize]") {
    TransformRegistry transforms;
    auto second = CustomerMapping();
    second.id = 2;
    second.target = {1, "contacts"};
    second.rules = {{"name", "label", RuleKind::Transform, "toLowerCase"}};
    const CollectionMap available{
        {"users", {Row{{"uid", Value("1")}, {"name", Value("Ann")}},
                   Row{{"uid", Value("2")}, {"name", Value("Bob")}}}}};
    const CollectionMap before = available;

    auto first_run = SynthesizeCollections({CustomerMapping(), second}, available, transforms);
    auto second_run = SynthesizeCollections({CustomerMapping(), second}, available, transforms);

    REQUIRE(first_run.size() == 2);
    CHECK(first_run == second_run);
    CHECK(available == before);
}
