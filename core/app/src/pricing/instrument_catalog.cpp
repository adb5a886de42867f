#include "tickrisk/pricing/instrument_catalog.hpp"

#include <cctype>
#include <utility>

namespace tickrisk {

namespace {

bool quotedInJpy(const std::string& symbol) {
  return symbol.size() >= 3 && symbol.compare(symbol.size() - 3, 3, "JPY") == 0;
}

Instrument make(const char* symbol, InstrumentClass cls,
                std::optional<double> reference_mid = std::nullopt) {
  Instrument i;
  i.symbol = symbol;
  i.instrument_class = cls;
  i.pip_size = quotedInJpy(i.symbol) ? 0.01 : 0.0001;
  i.contract_size = InstrumentCatalog::kContractSize;
  i.reference_mid = reference_mid;
  return i;
}

std::vector<Instrument> builtinInstruments() {
  using C = InstrumentClass;
  return {
      make("EUR/USD", C::Major, 1.099),
      make("GBP/USD", C::Major, 1.27),
      make("USD/JPY", C::Major, 149.5),
      make("USD/CHF", C::Major, 0.87),
      make("AUD/USD", C::Major, 0.66),
      make("USD/CAD", C::Major, 1.36),
      make("NZD/USD", C::Major, 0.61),

      make("EUR/GBP", C::Cross, 0.865),
      make("EUR/JPY", C::Cross, 164.3),
      make("EUR/CHF", C::Cross),
      make("EUR/AUD", C::Cross),
      make("EUR/CAD", C::Cross),
      make("EUR/NZD", C::Cross),
      make("GBP/JPY", C::Cross, 189.9),
      make("GBP/CHF", C::Cross),
      make("GBP/AUD", C::Cross),
      make("GBP/CAD", C::Cross),
      make("GBP/NZD", C::Cross),
      make("AUD/JPY", C::Cross),
      make("AUD/CHF", C::Cross),
      make("AUD/CAD", C::Cross),
      make("AUD/NZD", C::Cross),
      make("CAD/JPY", C::Cross),
      make("CAD/CHF", C::Cross),
      make("CHF/JPY", C::Cross),
      make("NZD/JPY", C::Cross),
      make("NZD/CHF", C::Cross),
      make("NZD/CAD", C::Cross),

      make("USD/MXN", C::Exotic),
      make("USD/ZAR", C::Exotic),
      make("USD/TRY", C::Exotic),
      make("USD/SEK", C::Exotic),
      make("USD/NOK", C::Exotic),
  };
}

}  // namespace

InstrumentCatalog::InstrumentCatalog()
    : InstrumentCatalog(builtinInstruments()) {}

InstrumentCatalog::InstrumentCatalog(std::vector<Instrument> instruments) {
  for (auto& i : instruments) {
    if (by_symbol_.count(i.symbol) == 0) {
      order_.push_back(i.symbol);
    }
    by_symbol_[i.symbol] = std::move(i);
  }
}

std::optional<Instrument> InstrumentCatalog::find(
    const std::string& symbol) const {
  auto it = by_symbol_.find(symbol);
  if (it == by_symbol_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool InstrumentCatalog::contains(const std::string& symbol) const {
  return by_symbol_.count(symbol) != 0;
}

double InstrumentCatalog::pipSize(const std::string& symbol) const {
  auto it = by_symbol_.find(symbol);
  if (it != by_symbol_.end()) {
    return it->second.pip_size;
  }
  return quotedInJpy(symbol) ? 0.01 : 0.0001;
}

double InstrumentCatalog::defaultSpread(const std::string& symbol) const {
  auto it = by_symbol_.find(symbol);
  if (it == by_symbol_.end()) {
    return kUnknownDefaultSpread;
  }
  const double pip = it->second.pip_size;
  switch (it->second.instrument_class) {
    case InstrumentClass::Major:  return 1.5 * pip;
    case InstrumentClass::Cross:  return 3.0 * pip;
    case InstrumentClass::Exotic: return 40.0 * pip;
  }
  return kUnknownDefaultSpread;
}

std::optional<std::string> InstrumentCatalog::canonicalSymbol(
    const std::string& feed_symbol) {
  std::string s = feed_symbol;
  if (s.size() > 2 && s[1] == ':') {
    s = s.substr(2);
  }

  std::string letters;
  letters.reserve(6);
  for (char c : s) {
    if (c == '-' || c == '/') {
      continue;
    }
    if (!std::isalpha(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
    letters.push_back(
        static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }

  if (letters.size() != 6) {
    return std::nullopt;
  }
  return letters.substr(0, 3) + "/" + letters.substr(3, 3);
}

}  // namespace tickrisk
