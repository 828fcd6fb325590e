#include "byterate/duration-format.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

#include "byterate/builtin-languages.hpp"
#include "byterate/errors.hpp"
#include "byterate/language-registry.hpp"
#include "byterate/language-table.hpp"

namespace byterate {

class DurationFormatTest : public ::testing::Test {
 protected:
  void SetUp() override { LoadBuiltinLanguages(registry); }

  std::string render(double seconds, std::string_view lang = "en") const { return FormatDuration(seconds, registry, lang); }

  LanguageRegistry registry;
};

TEST_F(DurationFormatTest, LessThanASecond) {
  EXPECT_EQ(render(0), "less than a second");
  EXPECT_EQ(render(0.999), "less than a second");
  EXPECT_EQ(render(-5), "less than a second");
  EXPECT_EQ(render(0.5, "fr"), "moins d'une seconde");
}

TEST_F(DurationFormatTest, SecondsOnly) {
  EXPECT_EQ(render(1), "1 second");
  EXPECT_EQ(render(1.9), "1 second");
  EXPECT_EQ(render(42), "42 seconds");
  EXPECT_EQ(render(59), "59 seconds");
}

TEST_F(DurationFormatTest, MinutesAndSeconds) {
  EXPECT_EQ(render(60), "1 minute");
  EXPECT_EQ(render(61), "1 minute, 1 second");
  EXPECT_EQ(render(130), "2 minutes, 10 seconds");
  EXPECT_EQ(render(3599), "59 minutes, 59 seconds");
}

TEST_F(DurationFormatTest, HoursDropSeconds) {
  EXPECT_EQ(render(3600), "1 hour");
  EXPECT_EQ(render(3659), "1 hour");
  EXPECT_EQ(render(3660), "1 hour, 1 minute");
  EXPECT_EQ(render(7325), "2 hours, 2 minutes");
}

TEST_F(DurationFormatTest, DaysAndHours) {
  EXPECT_EQ(render(86400), "1 day");
  EXPECT_EQ(render(86400 + 3599), "1 day");
  EXPECT_EQ(render(216000), "2 days, 12 hours");
  EXPECT_EQ(render(86400 * 400), "400 days");
}

TEST_F(DurationFormatTest, Russian) {
  EXPECT_EQ(render(130, "ru"), "2 минуты и 10 секунд");
  EXPECT_EQ(render(1, "ru"), "1 секунда");
  EXPECT_EQ(render(21 * 60 + 22, "ru"), "21 минута и 22 секунды");
  EXPECT_EQ(render(11 * 3600, "ru"), "11 часов");
  EXPECT_EQ(render(3 * 86400 + 3600, "ru"), "3 дня и 1 час");
}

TEST_F(DurationFormatTest, OtherLanguages) {
  EXPECT_EQ(render(130, "de"), "2 Minuten und 10 Sekunden");
  EXPECT_EQ(render(3660, "es"), "1 hora y 1 minuto");
  EXPECT_EQ(render(7200, "nl"), "2 uur");
  EXPECT_EQ(render(130, "ja"), "2分10秒");
  EXPECT_EQ(render(90000, "zh"), "1天1小时");
  EXPECT_EQ(render(5, "ar"), "5 ثوان");
  EXPECT_EQ(render(11, "ar"), "11 ثانية");
  EXPECT_EQ(render(2, "ar"), "2 ثانية");
}

TEST_F(DurationFormatTest, DefaultAndFallbackLanguage) {
  EXPECT_EQ(FormatDuration(130, registry), "2 minutes, 10 seconds");
  registry.setDefaultLanguage("fr");
  EXPECT_EQ(FormatDuration(130, registry), "2 minutes et 10 secondes");
  EXPECT_EQ(render(130, "tlh"), "2 minutes, 10 seconds");
}

TEST_F(DurationFormatTest, NonFiniteIsAnError) {
  EXPECT_THROW(render(std::numeric_limits<double>::infinity()), InvalidArgumentError);
  EXPECT_THROW(render(std::numeric_limits<double>::quiet_NaN()), InvalidArgumentError);
}

TEST(RenderUnitTest, CustomTable) {
  LanguageTable table = LanguageTable{}
                            .withCode("xx")
                            .withFormat("[{unit}:{value}]")
                            .withLessThanSecond("now")
                            .withForm("day", "sun")
                            .withPluralFunction([](int64_t, std::string_view unit) { return std::string(unit); });
  EXPECT_EQ(RenderUnit(3, "day", table), "[sun:3]");
  EXPECT_THROW(RenderUnit(3, "hour", table), MissingFormKeyError);
  EXPECT_EQ(FormatDuration(2 * 86400, table), "[sun:2]");
}

TEST(RenderUnitTest, UnknownPlaceholdersAreKept) {
  LanguageTable table =
      LanguageTable{}.withCode("xx").withFormat("{value} {other} {unit}").withLessThanSecond("now").withForm(
          "seconds", "s");
  EXPECT_EQ(RenderUnit(5, "second", table), "5 {other} s");
}

TEST(RenderUnitTest, MissingFormDuringFormatting) {
  LanguageRegistry registry;
  registry.addLanguage("xx", LanguageTable{}.withLessThanSecond("now").withForm("second", "s"));
  EXPECT_EQ(FormatDuration(1, registry), "1 s");
  EXPECT_THROW(FormatDuration(2, registry), MissingFormKeyError);
}

}  // namespace byterate
