#include "test_helpers.h"

#include "layout_verifier.h"

namespace offsetgen {
namespace test {

class LayoutVerifierTest : public ::testing::Test {
protected:
  void SetUp() override { registry = make_default_registry(8); }

  HostLayout host_ok(const LayoutPlan &plan, EmissionStrategy strategy) {
    auto host = compute_host_layout(plan, registry, strategy);
    if (!host) {
      ADD_FAILURE() << llvm::toString(host.takeError());
      return HostLayout{};
    }
    return std::move(*host);
  }

  TypeRegistry registry;
};

// ============================================================================
// Host layout simulation
// ============================================================================

TEST_F(LayoutVerifierTest, PackedMatchesPlan) {
  LayoutPlan plan = plan_ok(make_struct("A", {field(0x0, "a", make_named("uint8_t")),
                                              field(0x1, "b", make_named("uint32_t")),
                                              field(0x5, "c", make_named("uint64_t"))}),
                            registry);
  HostLayout host = host_ok(plan, EmissionStrategy::Packed);
  ASSERT_EQ(host.members.size(), 3u);
  EXPECT_EQ(host.members[1].actual_offset, 1);
  EXPECT_EQ(host.members[2].actual_offset, 5);
  EXPECT_EQ(host.size, 13);
  EXPECT_EQ(host.alignment, 1);
  EXPECT_FALSE(static_cast<bool>(verify_layout(plan, host)));
}

TEST_F(LayoutVerifierTest, NaturalAlignmentDriftIsReported) {
  LayoutPlan plan = plan_ok(make_struct("A", {field(0x0, "a", make_named("uint8_t")),
                                              field(0x1, "b", make_named("uint32_t"))}),
                            registry);
  HostLayout host = host_ok(plan, EmissionStrategy::Natural);
  ASSERT_EQ(host.members.size(), 2u);
  EXPECT_EQ(host.members[1].actual_offset, 4);
  EXPECT_EQ(host.size, 8);
  EXPECT_EQ(host.alignment, 4);

  auto errors = collect_errors(verify_layout(plan, host));
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].kind(), LayoutErrorKind::OffsetMismatch);
  EXPECT_EQ(errors[0].struct_name(), "A");
  EXPECT_EQ(errors[0].field_name(), "b");
  EXPECT_EQ(errors[0].declared(), 1);
  EXPECT_EQ(errors[0].actual(), 4);
}

TEST_F(LayoutVerifierTest, NaturalLayoutWithExplicitPaddingPasses) {
  LayoutPlan plan = plan_ok(make_struct("A", {field(0x0, "a", make_named("uint8_t")),
                                              field(0x4, "b", make_named("uint32_t")),
                                              field(0x8, "c", make_pointer(make_named("A")))},
                                        0x10),
                            registry);
  HostLayout host = host_ok(plan, EmissionStrategy::Natural);
  EXPECT_EQ(host.size, 0x10);
  EXPECT_EQ(host.alignment, 8);
  EXPECT_FALSE(static_cast<bool>(verify_layout(plan, host)));
}

TEST_F(LayoutVerifierTest, TailRoundingIsASizeMismatch) {
  LayoutPlan plan = plan_ok(make_struct("A", {field(0x0, "a", make_named("uint64_t")),
                                              field(0x8, "b", make_named("uint8_t"))},
                                        0x9),
                            registry);
  HostLayout host = host_ok(plan, EmissionStrategy::Natural);
  EXPECT_EQ(host.size, 0x10);
  auto errors = collect_errors(verify_layout(plan, host));
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].kind(), LayoutErrorKind::SizeMismatch);
  EXPECT_EQ(errors[0].declared(), 0x9);
  EXPECT_EQ(errors[0].actual(), 0x10);
}

TEST_F(LayoutVerifierTest, EveryMismatchIsCollected) {
  LayoutPlan plan = plan_ok(make_struct("A", {field(0x0, "a", make_named("uint8_t")),
                                              field(0x1, "b", make_named("uint16_t")),
                                              field(0x3, "c", make_named("uint32_t"))},
                                        0x7),
                            registry);
  HostLayout host = host_ok(plan, EmissionStrategy::Natural);
  auto errors = collect_errors(verify_layout(plan, host));
  ASSERT_EQ(errors.size(), 3u);
  EXPECT_EQ(errors[0].field_name(), "b");
  EXPECT_EQ(errors[1].field_name(), "c");
  EXPECT_EQ(errors[2].kind(), LayoutErrorKind::SizeMismatch);
}

TEST_F(LayoutVerifierTest, PointerSizeModelDrift) {
  // Planned for a 32-bit target, simulated with 8-byte host pointers.
  TypeRegistry narrow = make_default_registry(4);
  LayoutPlan plan = plan_ok(make_struct("L", {field(0x0, "flink", make_pointer(make_named("L"))),
                                              field(0x4, "blink", make_pointer(make_named("L")))},
                                        0x8),
                            narrow);
  HostLayout host = host_ok(plan, EmissionStrategy::Packed);
  auto errors = collect_errors(verify_layout(plan, host));
  ASSERT_EQ(errors.size(), 2u);
  EXPECT_EQ(errors[0].kind(), LayoutErrorKind::OffsetMismatch);
  EXPECT_EQ(errors[0].field_name(), "blink");
  EXPECT_EQ(errors[1].kind(), LayoutErrorKind::SizeMismatch);
}

TEST_F(LayoutVerifierTest, EmptyStructHasSizeOne) {
  LayoutPlan plan = plan_ok(make_struct("E", {}), registry);
  HostLayout host = host_ok(plan, EmissionStrategy::Packed);
  EXPECT_TRUE(host.members.empty());
  EXPECT_EQ(host.size, 1);
}

TEST_F(LayoutVerifierTest, NestedStructUsesHostAlignment) {
  StructEntry inner;
  inner.size = 0x10;
  inner.host_size = 0x10;
  inner.host_alignment = 8;
  registry.structs["Inner"] = inner;
  LayoutPlan plan = plan_ok(make_struct("Outer", {field(0x0, "tag", make_named("uint8_t")),
                                                  field(0x1, "inner", make_named("Inner"))}),
                            registry);
  HostLayout host = host_ok(plan, EmissionStrategy::Natural);
  EXPECT_EQ(host.members[1].actual_offset, 8);
  EXPECT_EQ(host.size, 0x18);
}

TEST_F(LayoutVerifierTest, VerificationIsLogged) {
  LayoutPlan plan = plan_ok(make_struct("A", {field(0x0, "a", make_named("uint8_t")),
                                              field(0x1, "b", make_named("uint32_t"))}),
                            registry);
  HostLayout host = host_ok(plan, EmissionStrategy::Natural);
  std::vector<std::string> lines;
  llvm::consumeError(verify_layout(plan, host, [&](const std::string &line) { lines.push_back(line); }));
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], "A.a: declared 0x0, host 0x0");
  EXPECT_EQ(lines[1], "A.b: declared 0x1, host 0x4 MISMATCH");
}

TEST_F(LayoutVerifierTest, MismatchMessageNamesValues) {
  std::string text = error_text(
      make_mismatch_error(LayoutErrorKind::OffsetMismatch, "A", "b", 0x1, 0x4));
  EXPECT_EQ(text, "OffsetMismatch: A.b: host offset differs from declared offset "
                  "(declared 0x1, actual 0x4)");
}

// ============================================================================
// Emitted checks
// ============================================================================

TEST_F(LayoutVerifierTest, ChecksCoverFieldsAndSize) {
  LayoutPlan plan = plan_ok(make_struct("A", {field(0x0, "a", make_named("uint16_t")),
                                              field(0x8, "b", make_named("uint32_t"))},
                                        0x10),
                            registry);
  std::string text = render_offset_checks(plan);
  EXPECT_TRUE(contains(text, "#pragma GCC diagnostic ignored \"-Winvalid-offsetof\"\n"));
  EXPECT_TRUE(contains(
      text, "static_assert(offsetof(A, a) == 0x0, \"OffsetMismatch: A.a declared at 0x0\");\n"));
  EXPECT_TRUE(contains(
      text, "static_assert(offsetof(A, b) == 0x8, \"OffsetMismatch: A.b declared at 0x8\");\n"));
  EXPECT_TRUE(contains(
      text, "static_assert(sizeof(A) == 0x10, \"SizeMismatch: A declared as 0x10 bytes\");\n"));
  EXPECT_FALSE(contains(text, "_pad_"));
  EXPECT_FALSE(contains(text, "A_layout_check"));
}

TEST_F(LayoutVerifierTest, NoSizeCheckWithoutDeclaredSize) {
  LayoutPlan plan = plan_ok(make_struct("A", {field(0x0, "a", make_named("uint16_t"))}), registry);
  EXPECT_FALSE(contains(render_offset_checks(plan), "sizeof"));
}

TEST_F(LayoutVerifierTest, PrivateFieldsMoveChecksIntoFriend) {
  LayoutPlan plan = plan_ok(
      make_struct("A", {field(0x0, "a", make_named("uint16_t"), Visibility::Private)}), registry);
  std::string text = render_offset_checks(plan);
  EXPECT_TRUE(contains(text, "struct A_layout_check {\n"
                             "    static_assert(offsetof(A, a) == 0x0, "
                             "\"OffsetMismatch: A.a declared at 0x0\");\n"
                             "};\n"));
}

} // namespace test
} // namespace offsetgen
