#include "../common/assertions.hpp"
#include "agent/locality_table.hpp"

int main() {
  using netdiag::agent::kUndefinedLocality;
  using netdiag::agent::LocalityTable;
  using netdiag::tests::common::AssertEqual;
  using netdiag::tests::common::Fail;

  {
    // Longer prefixes win regardless of table order.
    const LocalityTable table({{"16", "Short"}, {"160", "Longer"}, {"1601", "Longest"}});
    AssertEqual(table.Lookup("1609999"), "Longer");
    AssertEqual(table.Lookup("1601000"), "Longest");
    AssertEqual(table.Lookup("1612345"), "Short");
    AssertEqual(table.Lookup("9999999"), kUndefinedLocality);
    AssertEqual(table.Lookup(""), kUndefinedLocality);
  }

  {
    const LocalityTable& table = LocalityTable::Default();
    if (table.size() < 40U) {
      Fail("default locality table looks truncated");
    }
    AssertEqual(table.Lookup("7700123"), "Москва");
    AssertEqual(table.Lookup("7800123"), "Санкт-Петербург");
    // Three-digit branch prefixes share leading digits with two-digit ones.
    AssertEqual(table.Lookup("1600001"), "Казань");
    AssertEqual(table.Lookup("4810001"), "Мичуринск");
    AssertEqual(table.Lookup("4800001"), "Липецк");
    AssertEqual(table.Lookup("0000001"), kUndefinedLocality);
  }

  return 0;
}
