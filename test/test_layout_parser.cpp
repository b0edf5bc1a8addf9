#include "test_helpers.h"

namespace offsetgen {
namespace test {

class LayoutParserTest : public ::testing::Test {
protected:
  llvm::Expected<LayoutFile> parse(const std::string &text) {
    return parse_layout(text, "test.layout", options);
  }

  ParseOptions options;
};

// ============================================================================
// Struct headers
// ============================================================================

TEST_F(LayoutParserTest, MinimalStruct) {
  LayoutFile file = parse_ok("struct Empty {}");
  ASSERT_EQ(file.structs.size(), 1u);
  const StructSpec &spec = file.structs[0];
  EXPECT_EQ(spec.name, "Empty");
  EXPECT_EQ(spec.visibility, Visibility::Public);
  EXPECT_EQ(spec.mode, GenerationMode::Plain);
  EXPECT_FALSE(spec.checked);
  EXPECT_FALSE(spec.total_size.has_value());
  EXPECT_TRUE(spec.fields.empty());
  EXPECT_EQ(file.source_name, "test.layout");
}

TEST_F(LayoutParserTest, StructModifiersInAnyOrder) {
  LayoutFile file = parse_ok("checked debug private struct A [0x10] {};\n"
                             "public plain struct B [16] {}");
  ASSERT_EQ(file.structs.size(), 2u);
  EXPECT_EQ(file.structs[0].visibility, Visibility::Private);
  EXPECT_EQ(file.structs[0].mode, GenerationMode::Debug);
  EXPECT_TRUE(file.structs[0].checked);
  EXPECT_EQ(file.structs[0].total_size, 0x10);
  EXPECT_EQ(file.structs[1].visibility, Visibility::Public);
  EXPECT_EQ(file.structs[1].mode, GenerationMode::Plain);
  EXPECT_EQ(file.structs[1].total_size, 16);
}

TEST_F(LayoutParserTest, DefaultModeComesFromOptions) {
  LayoutFile file = parse_ok("struct A {} plain struct B {}", GenerationMode::Debug);
  ASSERT_EQ(file.structs.size(), 2u);
  EXPECT_EQ(file.structs[0].mode, GenerationMode::Debug);
  EXPECT_EQ(file.structs[1].mode, GenerationMode::Plain);
}

TEST_F(LayoutParserTest, CommentsAreSkipped) {
  LayoutFile file = parse_ok("# leading\n"
                             "// line\n"
                             "struct /* inline */ A {\n"
                             "  0x0 uint32_t a; # trailing\n"
                             "}\n");
  ASSERT_EQ(file.structs.size(), 1u);
  ASSERT_EQ(file.structs[0].fields.size(), 1u);
  EXPECT_EQ(file.structs[0].fields[0].line, 4u);
}

// ============================================================================
// Fields
// ============================================================================

TEST_F(LayoutParserTest, FieldOffsetsNamesAndVisibility) {
  LayoutFile file = parse_ok("struct A {\n"
                             "  0 uint16_t a;\n"
                             "  0x8 private uint32_t b;\n"
                             "  12 public int8_t c;\n"
                             "}");
  const auto &fields = file.structs[0].fields;
  ASSERT_EQ(fields.size(), 3u);
  EXPECT_EQ(fields[0].offset, 0);
  EXPECT_EQ(fields[0].name, "a");
  EXPECT_EQ(fields[0].visibility, Visibility::Public);
  EXPECT_EQ(fields[1].offset, 8);
  EXPECT_EQ(fields[1].visibility, Visibility::Private);
  EXPECT_EQ(fields[2].offset, 12);
  EXPECT_EQ(fields[2].visibility, Visibility::Public);
}

TEST_F(LayoutParserTest, PointerAndConstTypes) {
  LayoutFile file = parse_ok("struct A { 0 const char **names; }");
  const TypeRef &type = file.structs[0].fields[0].type;
  ASSERT_EQ(type->kind, TypeKind::Pointer);
  ASSERT_EQ(type->target->kind, TypeKind::Pointer);
  const TypeRef &base = type->target->target;
  ASSERT_EQ(base->kind, TypeKind::Named);
  EXPECT_EQ(base->name, "char");
  ASSERT_EQ(base->qualifiers.size(), 1u);
  EXPECT_EQ(base->qualifiers[0], "const");
}

TEST_F(LayoutParserTest, MultiDimensionalArrayKeepsCOrder) {
  LayoutFile file = parse_ok("struct A { 0 uint8_t grid[2][3]; }");
  const TypeRef &outer = file.structs[0].fields[0].type;
  ASSERT_EQ(outer->kind, TypeKind::Array);
  EXPECT_EQ(outer->count, 2);
  ASSERT_EQ(outer->target->kind, TypeKind::Array);
  EXPECT_EQ(outer->target->count, 3);
  EXPECT_EQ(outer->target->target->name, "uint8_t");
}

TEST_F(LayoutParserTest, FieldsKeepDeclaredOrder) {
  // Ordering is validated by the planner, not the parser.
  LayoutFile file = parse_ok("struct A { 8 uint8_t b; 0 uint8_t a; }");
  const auto &fields = file.structs[0].fields;
  ASSERT_EQ(fields.size(), 2u);
  EXPECT_EQ(fields[0].name, "b");
  EXPECT_EQ(fields[1].name, "a");
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(LayoutParserTest, MissingSemicolonIsSyntaxError) {
  auto file = parse("struct A {\n  0 uint8_t a\n}");
  ASSERT_FALSE(static_cast<bool>(file));
  auto errors = collect_errors(file.takeError());
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].kind(), LayoutErrorKind::Syntax);
  EXPECT_EQ(errors[0].line(), 3u);
  EXPECT_TRUE(contains(errors[0].description(), "expected ';'"));
}

TEST_F(LayoutParserTest, UnexpectedCharacter) {
  auto file = parse("struct A { 0 uint8_t a = 1; }");
  ASSERT_FALSE(static_cast<bool>(file));
  std::string text = error_text(file.takeError());
  EXPECT_TRUE(contains(text, "Syntax"));
  EXPECT_TRUE(contains(text, "unexpected character '='"));
}

TEST_F(LayoutParserTest, UnterminatedStruct) {
  auto file = parse("struct A { 0 uint8_t a;");
  ASSERT_FALSE(static_cast<bool>(file));
  EXPECT_EQ(error_kind(file.takeError()), LayoutErrorKind::Syntax);
}

TEST_F(LayoutParserTest, UnterminatedBlockComment) {
  auto file = parse("struct A {} /* open");
  ASSERT_FALSE(static_cast<bool>(file));
  EXPECT_TRUE(contains(error_text(file.takeError()), "unterminated block comment"));
}

TEST_F(LayoutParserTest, InvalidAndOversizedLiterals) {
  auto bad = parse("struct A { 0x uint8_t a; }");
  ASSERT_FALSE(static_cast<bool>(bad));
  EXPECT_TRUE(contains(error_text(bad.takeError()), "invalid integer literal"));

  auto big = parse("struct A [0x100000000] {}");
  ASSERT_FALSE(static_cast<bool>(big));
  EXPECT_TRUE(contains(error_text(big.takeError()), "out of range"));
}

TEST_F(LayoutParserTest, ZeroArrayCountRejected) {
  auto file = parse("struct A { 0 uint8_t a[0]; }");
  ASSERT_FALSE(static_cast<bool>(file));
  EXPECT_TRUE(contains(error_text(file.takeError()), "array count must be positive"));
}

TEST_F(LayoutParserTest, KeywordIsNotAnIdentifier) {
  auto file = parse("struct checked {}");
  ASSERT_FALSE(static_cast<bool>(file));
  EXPECT_EQ(error_kind(file.takeError()), LayoutErrorKind::Syntax);
}

TEST_F(LayoutParserTest, DuplicateModifier) {
  auto file = parse("debug plain struct A {}");
  ASSERT_FALSE(static_cast<bool>(file));
  EXPECT_TRUE(contains(error_text(file.takeError()), "duplicate generation mode"));
}

TEST_F(LayoutParserTest, DuplicateStruct) {
  auto file = parse("struct A {}\nstruct A {}");
  ASSERT_FALSE(static_cast<bool>(file));
  auto errors = collect_errors(file.takeError());
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].kind(), LayoutErrorKind::DuplicateStruct);
  EXPECT_EQ(errors[0].struct_name(), "A");
  EXPECT_EQ(errors[0].line(), 2u);
}

TEST_F(LayoutParserTest, DuplicateField) {
  auto file = parse("struct A { 0 uint8_t a; 1 uint8_t a; }");
  ASSERT_FALSE(static_cast<bool>(file));
  auto errors = collect_errors(file.takeError());
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].kind(), LayoutErrorKind::DuplicateField);
  EXPECT_EQ(errors[0].field_name(), "a");
}

TEST_F(LayoutParserTest, FieldNamedLikeItsStruct) {
  auto file = parse("struct A { 0 uint8_t A; }");
  ASSERT_FALSE(static_cast<bool>(file));
  EXPECT_EQ(error_kind(file.takeError()), LayoutErrorKind::DuplicateField);
}

TEST_F(LayoutParserTest, PaddingPrefixIsReserved) {
  auto field = parse("struct A { 0 uint8_t _pad_0x0; }");
  ASSERT_FALSE(static_cast<bool>(field));
  EXPECT_EQ(error_kind(field.takeError()), LayoutErrorKind::ReservedName);

  auto name = parse("struct _pad_A {}");
  ASSERT_FALSE(static_cast<bool>(name));
  EXPECT_EQ(error_kind(name.takeError()), LayoutErrorKind::ReservedName);
}

TEST_F(LayoutParserTest, CxxKeywordsAreReserved) {
  auto file = parse("struct A {\n  0x0 uint32_t class;\n}");
  ASSERT_FALSE(static_cast<bool>(file));
  auto errors = collect_errors(file.takeError());
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].kind(), LayoutErrorKind::ReservedName);
  EXPECT_EQ(errors[0].field_name(), "class");
  EXPECT_EQ(errors[0].line(), 2u);
  EXPECT_TRUE(contains(errors[0].description(), "C++ keyword"));

  auto other = parse("struct A { 0x0 uint32_t new; }");
  ASSERT_FALSE(static_cast<bool>(other));
  EXPECT_EQ(error_kind(other.takeError()), LayoutErrorKind::ReservedName);

  auto name = parse("struct union {}");
  ASSERT_FALSE(static_cast<bool>(name));
  EXPECT_EQ(error_kind(name.takeError()), LayoutErrorKind::ReservedName);
}

TEST_F(LayoutParserTest, BaseTypeNamesAreReserved) {
  auto field = parse("struct A { 0x0 uint8_t uint8_t; }");
  ASSERT_FALSE(static_cast<bool>(field));
  auto errors = collect_errors(field.takeError());
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].kind(), LayoutErrorKind::ReservedName);
  EXPECT_EQ(errors[0].field_name(), "uint8_t");
  EXPECT_TRUE(contains(errors[0].description(), "base type"));

  auto name = parse("struct size_t { 0x0 uint8_t a; }");
  ASSERT_FALSE(static_cast<bool>(name));
  auto name_errors = collect_errors(name.takeError());
  ASSERT_EQ(name_errors.size(), 1u);
  EXPECT_EQ(name_errors[0].kind(), LayoutErrorKind::ReservedName);
  EXPECT_EQ(name_errors[0].struct_name(), "size_t");

  // Base types stay usable as field types.
  LayoutFile file = parse_ok("struct A { 0x0 size_t count; 0x8 uint8_t value; }");
  EXPECT_EQ(file.structs[0].fields.size(), 2u);
}

} // namespace test
} // namespace offsetgen
