#include "agent/locality_table.hpp"

#include <utility>

namespace netdiag::agent {

LocalityTable::LocalityTable(std::map<std::string, std::string> prefix_to_locality)
    : prefix_to_locality_(std::move(prefix_to_locality)) {}

std::string LocalityTable::Lookup(const std::string_view agreement_id) const {
  const std::string* best = nullptr;
  std::size_t best_length = 0;
  for (const auto& [prefix, locality] : prefix_to_locality_) {
    if (prefix.empty() || prefix.size() <= best_length) {
      continue;
    }
    if (agreement_id.substr(0, prefix.size()) == prefix) {
      best = &locality;
      best_length = prefix.size();
    }
  }
  return best != nullptr ? *best : std::string(kUndefinedLocality);
}

const LocalityTable& LocalityTable::Default() {
  static const LocalityTable table(std::map<std::string, std::string>{
      {"22", "Барнаул"},
      {"32", "Брянск"},
      {"34", "Волга"},
      {"36", "Воронеж"},
      {"66", "Екатеринбург"},
      {"18", "Ижевск"},
      {"38", "Иркутск"},
      {"12", "Йошкар-Ола"},
      {"160", "Казань"},
      {"43", "Киров"},
      {"23", "Краснодар"},
      {"24", "Красноярск"},
      {"45", "Курган"},
      {"46", "Курск"},
      {"48", "Липецк"},
      {"27", "Магнитогорск"},
      {"481", "Мичуринск"},
      {"77", "Москва"},
      {"161", "Набережные Челны"},
      {"162", "Нижнекамск"},
      {"52", "Нижний Новгород"},
      {"54", "Новосибирск"},
      {"55", "Омск"},
      {"56", "Оренбург"},
      {"58", "Пенза"},
      {"59", "Пермь"},
      {"61", "Ростов-на-Дону"},
      {"62", "Рязань"},
      {"63", "Самара"},
      {"78", "Санкт-Петербург"},
      {"64", "Саратов"},
      {"30", "Селенгинск"},
      {"69", "Тверь"},
      {"70", "Томск"},
      {"71", "Тула"},
      {"72", "Тюмень"},
      {"303", "Улан-Удэ"},
      {"73", "Ульяновск"},
      {"10", "Уфа"},
      {"21", "Чебоксары"},
      {"17", "Челябинск"},
      {"76", "Ярославль"},
  });
  return table;
}

} // namespace netdiag::agent
