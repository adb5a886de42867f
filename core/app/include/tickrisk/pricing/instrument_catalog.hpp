#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tickrisk {

enum class InstrumentClass { Major, Cross, Exotic };

// -----------------------------------------------------------------------------
// Instrument — static reference data for one FX pair
// -----------------------------------------------------------------------------
struct Instrument {
  std::string symbol;              // Canonical "BASE/QUOTE"
  InstrumentClass instrument_class{InstrumentClass::Cross};
  double pip_size{0.0001};
  double contract_size{100000.0};
  std::optional<double> reference_mid;  // Last-resort static price
};

// -----------------------------------------------------------------------------
// InstrumentCatalog — the set of tradable pairs and their conventions
// -----------------------------------------------------------------------------
//
// @brief  Immutable lookup of pip size, class and reference price by
//         canonical symbol, plus feed-symbol canonicalisation.
//
// @details
// The default-constructed catalog carries the 33 supported pairs: 7 majors,
// 21 crosses and 5 exotics. Symbols outside the catalog still work
// everywhere; they get the generic conventions (pip 0.0001, or 0.01 when
// quoted in JPY) and an unclassified default spread.
//
// Thread model:
//   Never mutated after construction; safe for concurrent reads.
// -----------------------------------------------------------------------------
class InstrumentCatalog {
 public:
  static constexpr double kContractSize = 100000.0;
  static constexpr double kUnknownDefaultSpread = 0.0002;

  InstrumentCatalog();
  explicit InstrumentCatalog(std::vector<Instrument> instruments);

  std::optional<Instrument> find(const std::string& symbol) const;
  bool contains(const std::string& symbol) const;

  // All catalog symbols, majors first, in declaration order.
  const std::vector<std::string>& symbols() const { return order_; }

  // -------------------------------------------------------------------------
  // pipSize(symbol)
  // -------------------------------------------------------------------------
  // @return 0.01 for pairs quoted in JPY, 0.0001 otherwise (catalog value
  //         when the symbol is known).
  // -------------------------------------------------------------------------
  double pipSize(const std::string& symbol) const;

  // -------------------------------------------------------------------------
  // defaultSpread(symbol)
  // -------------------------------------------------------------------------
  // @brief  Conservative spread used until a real observation arrives.
  //
  // @return Major 1.5 pips, cross 3 pips, exotic 40 pips; 0.0002 for
  //         symbols outside the catalog.
  // -------------------------------------------------------------------------
  double defaultSpread(const std::string& symbol) const;

  // -------------------------------------------------------------------------
  // canonicalSymbol(feed_symbol)
  // -------------------------------------------------------------------------
  // @brief  Maps feed spellings onto "BASE/QUOTE".
  //
  // @details
  // Accepts "C:EURUSD", "EURUSD", "EUR-USD", "EUR/USD" and lowercase
  // variants. Returns std::nullopt when the remainder is not six letters.
  // -------------------------------------------------------------------------
  static std::optional<std::string> canonicalSymbol(
      const std::string& feed_symbol);

 private:
  std::unordered_map<std::string, Instrument> by_symbol_;
  std::vector<std::string> order_;
};

}  // namespace tickrisk
