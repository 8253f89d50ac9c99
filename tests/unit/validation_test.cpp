#include "internal/ledger/validation.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using datamarket::db::model::DatasetRecord;
using datamarket::ledger::AggregateCost;
using datamarket::ledger::AllDatasetsUsable;
using datamarket::ledger::CheckedAdd;
using datamarket::ledger::DatasetResolver;
using datamarket::ledger::kMaxAmount;
using datamarket::ledger::PriceEntries;
using datamarket::ledger::RequireAmount;
using datamarket::ledger::RequireBounded;
using datamarket::ledger::RequireIdentity;
using datamarket::util::InvalidParameters;

template <typename Fn>
bool ThrowsInvalidParameters(Fn&& fn) {
  try {
    fn();
  } catch (const InvalidParameters&) {
    return true;
  }
  return false;
}

DatasetResolver ResolverFor(const std::map<uint64_t, DatasetRecord>& datasets) {
  return [&datasets](uint64_t id) -> std::optional<DatasetRecord> {
    auto it = datasets.find(id);
    if (it == datasets.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

DatasetRecord Dataset(uint64_t id, uint64_t price, bool active = true) {
  DatasetRecord record;
  record.id            = id;
  record.owner         = "owner";
  record.price_per_use = price;
  record.active        = active;
  return record;
}

void TestBoundedStringsAcceptLimitAndRejectPastIt() {
  RequireBounded("name", std::string(100, 'n'), 100);
  RequireBounded("name", "", 100);
  assert(ThrowsInvalidParameters([] { RequireBounded("name", std::string(101, 'n'), 100); }));
}

void TestIdentityMustBeNonEmptyAndBounded() {
  RequireIdentity("alice");
  RequireIdentity(std::string(128, 'a'));
  assert(ThrowsInvalidParameters([] { RequireIdentity(""); }));
  assert(ThrowsInvalidParameters([] { RequireIdentity(std::string(129, 'a')); }));
}

void TestAmountsAreBoundedBySignedMaximum() {
  RequireAmount("amount", 0);
  RequireAmount("amount", kMaxAmount);
  assert(ThrowsInvalidParameters([] { RequireAmount("amount", kMaxAmount + 1); }));

  assert(CheckedAdd("sum", 2, 3) == 5);
  assert(CheckedAdd("sum", kMaxAmount - 1, 1) == kMaxAmount);
  assert(ThrowsInvalidParameters([] { CheckedAdd("sum", kMaxAmount, 1); }));
}

void TestUsabilityIsConjunctionOverWholeList() {
  const std::map<uint64_t, DatasetRecord> datasets = {{1, Dataset(1, 10)}, {2, Dataset(2, 15)}, {3, Dataset(3, 5, false)}};
  auto                                    resolve  = ResolverFor(datasets);

  assert(AllDatasetsUsable({}, resolve));
  assert(AllDatasetsUsable({1, 2, 1}, resolve));
  assert(!AllDatasetsUsable({1, 3}, resolve));
  assert(!AllDatasetsUsable({9, 1}, resolve));
  assert(!AllDatasetsUsable({1, 2, 9}, resolve));
}

void TestCostCountsEveryOccurrence() {
  const std::map<uint64_t, DatasetRecord> datasets = {{1, Dataset(1, 10)}, {2, Dataset(2, 15)}};
  auto                                    resolve  = ResolverFor(datasets);

  const auto entries = PriceEntries({1, 1, 2}, resolve);
  assert(entries.size() == 3);
  assert(entries[0].dataset_id == 1 && entries[0].price == 10);
  assert(entries[1].dataset_id == 1 && entries[1].price == 10);
  assert(entries[2].dataset_id == 2 && entries[2].price == 15);
  assert(AggregateCost(entries) == 35);

  assert(AggregateCost(PriceEntries({2, 1, 1}, resolve)) == 35);
  assert(AggregateCost(PriceEntries({}, resolve)) == 0);
}

void TestUnresolvedEntryContributesNothing() {
  const std::map<uint64_t, DatasetRecord> datasets = {{1, Dataset(1, 10)}};
  auto                                    resolve  = ResolverFor(datasets);

  const auto entries = PriceEntries({1, 42}, resolve);
  assert(entries.size() == 2);
  assert(entries[1].price == 0);
  assert(AggregateCost(entries) == 10);
}

void TestCostOverflowIsInvalidParameters() {
  const std::map<uint64_t, DatasetRecord> datasets = {{1, Dataset(1, kMaxAmount)}};
  auto                                    resolve  = ResolverFor(datasets);

  assert(AggregateCost(PriceEntries({1}, resolve)) == kMaxAmount);
  assert(ThrowsInvalidParameters([&] { AggregateCost(PriceEntries({1, 1}, resolve)); }));
}

} // namespace

int main() {
  TestBoundedStringsAcceptLimitAndRejectPastIt();
  TestIdentityMustBeNonEmptyAndBounded();
  TestAmountsAreBoundedBySignedMaximum();
  TestUsabilityIsConjunctionOverWholeList();
  TestCostCountsEveryOccurrence();
  TestUnresolvedEntryContributesNothing();
  TestCostOverflowIsInvalidParameters();

  std::cout << "datamarket_unit_validation: pass\n";
  return 0;
}
