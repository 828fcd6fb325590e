#include "byterate/builtin-languages.hpp"

#include <iterator>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "byterate/errors.hpp"
#include "byterate/language-registry.hpp"
#include "byterate/language-table.hpp"
#include "byterate/plural-rule.hpp"

namespace byterate {

namespace {

constexpr std::string_view kBuiltinCodes[] = {"en", "de", "es", "fr", "it", "nl", "pt", "ru", "ar", "ja", "zh"};

// Table with the common form keys: singular, then plural, for second, minute, hour and day.
LanguageTable SimpleTable(std::string_view code, std::string_view name, std::string_view separator,
                          std::string_view lessThanSecond, const std::string_view (&forms)[8]) {
  return LanguageTable{}
      .withCode(code)
      .withName(name)
      .withSeparator(separator)
      .withLessThanSecond(lessThanSecond)
      .withForm("second", forms[0])
      .withForm("seconds", forms[1])
      .withForm("minute", forms[2])
      .withForm("minutes", forms[3])
      .withForm("hour", forms[4])
      .withForm("hours", forms[5])
      .withForm("day", forms[6])
      .withForm("days", forms[7]);
}

LanguageTable Russian() {
  return SimpleTable("ru", "Русский", " и ", "менее секунды",
                     {"секунда", "секунд", "минута", "минут", "час", "часов", "день", "дней"})
      .withForm("second_few", "секунды")
      .withForm("minute_few", "минуты")
      .withForm("hour_few", "часа")
      .withForm("day_few", "дня")
      .withPluralRule(std::make_shared<SlavicPluralRule>());
}

LanguageTable Arabic() {
  return SimpleTable("ar", "العربية", " و ", "أقل من ثانية",
                     {"ثانية", "ثوان", "دقيقة", "دقائق", "ساعة", "ساعات", "يوم", "أيام"})
      .withForm("seconds_many", "ثانية")
      .withForm("minutes_many", "دقيقة")
      .withForm("hours_many", "ساعة")
      .withForm("days_many", "يوم")
      .withPluralRule(std::make_shared<ArabicPluralRule>());
}

LanguageTable Japanese() {
  return SimpleTable("ja", "日本語", "", "1秒未満", {"秒", "秒", "分", "分", "時間", "時間", "日", "日"})
      .withFormat("{value}{unit}")
      .withPluralRule(std::make_shared<InvariantPluralRule>());
}

LanguageTable Chinese() {
  return SimpleTable("zh", "中文", "", "不到一秒", {"秒", "秒", "分钟", "分钟", "小时", "小时", "天", "天"})
      .withFormat("{value}{unit}")
      .withPluralRule(std::make_shared<InvariantPluralRule>());
}

}  // namespace

std::span<const std::string_view> BuiltinLanguageCodes() noexcept { return kBuiltinCodes; }

LanguageTable BuiltinLanguage(std::string_view code) {
  if (code == "en") {
    return SimpleTable("en", "English", ", ", "less than a second",
                       {"second", "seconds", "minute", "minutes", "hour", "hours", "day", "days"});
  }
  if (code == "de") {
    return SimpleTable("de", "Deutsch", " und ", "weniger als eine Sekunde",
                       {"Sekunde", "Sekunden", "Minute", "Minuten", "Stunde", "Stunden", "Tag", "Tage"});
  }
  if (code == "es") {
    return SimpleTable("es", "Español", " y ", "menos de un segundo",
                       {"segundo", "segundos", "minuto", "minutos", "hora", "horas", "día", "días"});
  }
  if (code == "fr") {
    return SimpleTable("fr", "Français", " et ", "moins d'une seconde",
                       {"seconde", "secondes", "minute", "minutes", "heure", "heures", "jour", "jours"});
  }
  if (code == "it") {
    return SimpleTable("it", "Italiano", " e ", "meno di un secondo",
                       {"secondo", "secondi", "minuto", "minuti", "ora", "ore", "giorno", "giorni"});
  }
  if (code == "nl") {
    // "uur" is both singular and plural
    return SimpleTable("nl", "Nederlands", " en ", "minder dan een seconde",
                       {"seconde", "seconden", "minuut", "minuten", "uur", "uur", "dag", "dagen"});
  }
  if (code == "pt") {
    return SimpleTable("pt", "Português", " e ", "menos de um segundo",
                       {"segundo", "segundos", "minuto", "minutos", "hora", "horas", "dia", "dias"});
  }
  if (code == "ru") {
    return Russian();
  }
  if (code == "ar") {
    return Arabic();
  }
  if (code == "ja") {
    return Japanese();
  }
  if (code == "zh") {
    return Chinese();
  }
  throw UnknownLanguageError("No builtin language '{}'", code);
}

std::vector<std::string> LoadBuiltinLanguages(LanguageRegistry& registry) {
  std::vector<std::string> ret;
  ret.reserve(std::size(kBuiltinCodes));
  for (std::string_view code : kBuiltinCodes) {
    ret.push_back(registry.loadLanguage([code] { return BuiltinLanguage(code); }));
  }
  return ret;
}

}  // namespace byterate
