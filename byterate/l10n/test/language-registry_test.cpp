#include "byterate/language-registry.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "byterate/builtin-languages.hpp"
#include "byterate/errors.hpp"
#include "byterate/language-table.hpp"

namespace byterate {

namespace {
LanguageTable Pirate() {
  return LanguageTable{}
      .withCode("xp")
      .withName("Pirate")
      .withSeparator(" an' ")
      .withLessThanSecond("a blink")
      .withForm("second", "tick")
      .withForm("seconds", "ticks");
}
}  // namespace

TEST(LanguageRegistryTest, EmptyRegistry) {
  LanguageRegistry registry;
  EXPECT_TRUE(registry.empty());
  EXPECT_TRUE(registry.defaultLanguage().empty());
  EXPECT_FALSE(registry.isLanguageLoaded("en"));
  EXPECT_TRUE(registry.loadedLanguages().empty());
  EXPECT_THROW((void)registry.resolve(), UnknownLanguageError);
  EXPECT_THROW((void)registry.resolve("fr"), UnknownLanguageError);
  EXPECT_THROW(registry.setDefaultLanguage("en"), UnknownLanguageError);
}

TEST(LanguageRegistryTest, FirstLanguageBecomesDefault) {
  LanguageRegistry registry;
  registry.addLanguage("fr", BuiltinLanguage("fr"));
  EXPECT_EQ(registry.defaultLanguage(), "fr");

  registry.addLanguage("en", BuiltinLanguage("en"));
  EXPECT_EQ(registry.defaultLanguage(), "fr");
  EXPECT_EQ(registry.resolve().code, "fr");

  registry.setDefaultLanguage("en");
  EXPECT_EQ(registry.defaultLanguage(), "en");
  EXPECT_EQ(registry.resolve().code, "en");
}

TEST(LanguageRegistryTest, AddReplacesAndUsesGivenCode) {
  LanguageRegistry registry;
  registry.addLanguage("xp", Pirate());
  registry.addLanguage("xp", Pirate().withLessThanSecond("a wink"));
  EXPECT_EQ(registry.size(), 1U);
  EXPECT_EQ(registry.resolve("xp").lessThanSecond, "a wink");

  registry.addLanguage("xp-alt", Pirate());
  EXPECT_EQ(registry.resolve("xp-alt").code, "xp-alt");
}

TEST(LanguageRegistryTest, AddValidatesTable) {
  LanguageRegistry registry;
  EXPECT_THROW(registry.addLanguage("", Pirate()), InvalidArgumentError);
  EXPECT_THROW(registry.addLanguage("xp", Pirate().withFormat("{value}")), InvalidArgumentError);
  EXPECT_THROW(registry.addLanguage("xp", Pirate().withFormat("{unit}")), InvalidArgumentError);
  EXPECT_THROW(registry.addLanguage("xp", Pirate().withLessThanSecond("")), InvalidArgumentError);
  EXPECT_TRUE(registry.empty());
}

TEST(LanguageRegistryTest, LoadLanguageWithLoader) {
  LanguageRegistry registry;
  EXPECT_EQ(registry.loadLanguage(Pirate), "xp");
  EXPECT_TRUE(registry.isLanguageLoaded("xp"));
  EXPECT_EQ(registry.defaultLanguage(), "xp");

  EXPECT_THROW(registry.loadLanguage([] { return LanguageTable{}.withLessThanSecond("x"); }), InvalidArgumentError);
}

TEST(LanguageRegistryTest, FallsBackToEnglish) {
  LanguageRegistry registry;
  registry.addLanguage("xp", Pirate());
  EXPECT_THROW((void)registry.resolve("de"), UnknownLanguageError);

  registry.addLanguage("en", BuiltinLanguage("en"));
  EXPECT_EQ(registry.resolve("de").code, "en");
  EXPECT_EQ(registry.resolve("xp").code, "xp");
}

TEST(LanguageRegistryTest, LoadBuiltinLanguages) {
  LanguageRegistry registry;
  const std::vector<std::string> codes = LoadBuiltinLanguages(registry);
  ASSERT_EQ(codes.size(), BuiltinLanguageCodes().size());
  EXPECT_EQ(codes.front(), "en");
  EXPECT_EQ(registry.defaultLanguage(), "en");
  EXPECT_EQ(registry.loadedLanguages(),
            (std::vector<std::string>{"ar", "de", "en", "es", "fr", "it", "ja", "nl", "pt", "ru", "zh"}));
  EXPECT_EQ(registry.resolve("nl").name, "Nederlands");
  EXPECT_THROW(BuiltinLanguage("tlh"), UnknownLanguageError);
}

TEST(LanguageTableTest, FormLookup) {
  const LanguageTable table = Pirate();
  EXPECT_EQ(table.form("second"), "tick");
  EXPECT_THROW((void)table.form("minute"), MissingFormKeyError);
  EXPECT_EQ(table.rule().formKey(2, "second"), "seconds");
}

}  // namespace byterate
