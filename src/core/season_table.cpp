#include "pheno-index/core/season_table.hpp"

#include "pheno-index/core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <map>
#include <set>
#include <sstream>
#include <tuple>
#include <unordered_set>

namespace phenoindex::core {

namespace {

template <typename T>
const std::vector<T> &requireColumn(const std::map<std::string, SeasonTable::Column> &columns, const std::string &name,
                                    const char *expected_type) {
	const auto it = columns.find(name);
	if (it == columns.end()) {
		throw InputContractError("Season table is missing column '" + name + "'.");
	}
	const auto *values = std::get_if<std::vector<T>>(&it->second);
	if (!values) {
		throw InputContractError("Season table column '" + name + "' must hold " + expected_type + " values.");
	}
	return *values;
}

std::size_t columnLength(const SeasonTable::Column &column) {
	return std::visit([](const auto &values) { return values.size(); }, column);
}

} // namespace

SeasonTable::SeasonTable(std::vector<SeasonCount> rows) : rows_(std::move(rows)) {
	validate();
}

const std::vector<std::string> &SeasonTable::requiredColumns() {
	static const std::vector<std::string> kColumns {"SPECIES",  "SITE_ID",  "DATE",  "WEEK",   "WEEK_DAY",     "DAY_SINCE",
	                                                "M_YEAR",   "M_SEASON", "COUNT", "ANCHOR", "COMPLT_SEASON"};
	return kColumns;
}

std::string SeasonTable::normalizeColumnName(std::string name) {
	std::transform(name.begin(), name.end(), name.begin(),
	               [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
	return name;
}

SeasonTable SeasonTable::fromColumns(std::vector<NamedColumn> columns) {
	std::map<std::string, Column> by_name;
	for (auto &entry : columns) {
		auto name = normalizeColumnName(entry.first);
		if (by_name.count(name) > 0) {
			throw InputContractError("Season table column '" + name + "' is given more than once.");
		}
		by_name.emplace(std::move(name), std::move(entry.second));
	}

	std::vector<std::string> missing;
	for (const auto &name : requiredColumns()) {
		if (by_name.count(name) == 0) {
			missing.push_back(name);
		}
	}
	if (!missing.empty()) {
		std::ostringstream message;
		message << "Season table is missing required column(s):";
		for (const auto &name : missing) {
			message << ' ' << name;
		}
		throw InputContractError(message.str());
	}

	const std::size_t length = columnLength(by_name.at("SITE_ID"));
	for (const auto &name : requiredColumns()) {
		if (columnLength(by_name.at(name)) != length) {
			throw InputContractError("Season table column '" + name + "' has " +
			                         std::to_string(columnLength(by_name.at(name))) + " rows, expected " +
			                         std::to_string(length) + ".");
		}
	}

	const auto &species = requireColumn<std::string>(by_name, "SPECIES", "text");
	const auto &site_id = requireColumn<std::string>(by_name, "SITE_ID", "text");
	const auto &date = requireColumn<TimePoint>(by_name, "DATE", "date");
	const auto &week = requireColumn<std::int64_t>(by_name, "WEEK", "integer");
	const auto &week_day = requireColumn<std::int64_t>(by_name, "WEEK_DAY", "integer");
	const auto &day_since = requireColumn<std::int64_t>(by_name, "DAY_SINCE", "integer");
	const auto &m_year = requireColumn<std::int64_t>(by_name, "M_YEAR", "integer");
	const auto &m_season = requireColumn<std::int64_t>(by_name, "M_SEASON", "integer");
	const auto &count = requireColumn<std::optional<double>>(by_name, "COUNT", "nullable numeric");
	const auto &anchor = requireColumn<std::int64_t>(by_name, "ANCHOR", "integer");
	const auto &complete = requireColumn<std::int64_t>(by_name, "COMPLT_SEASON", "integer");

	std::vector<SeasonCount> rows;
	rows.reserve(length);
	for (std::size_t i = 0; i < length; ++i) {
		SeasonCount row;
		row.species = species[i];
		row.site_id = site_id[i];
		row.date = date[i];
		row.week = static_cast<int>(week[i]);
		row.week_day = static_cast<int>(week_day[i]);
		row.day_since = day_since[i];
		row.m_year = static_cast<int>(m_year[i]);
		row.m_season = static_cast<int>(m_season[i]);
		row.count = count[i];
		row.anchor = anchor[i] != 0;
		row.complete_season = complete[i] == 1;
		rows.push_back(std::move(row));
	}
	return SeasonTable(std::move(rows));
}

void SeasonTable::validate() const {
	std::set<std::tuple<std::string, std::string, std::int64_t>> seen;
	for (const auto &row : rows_) {
		if (row.count && !std::isfinite(*row.count)) {
			throw InputContractError("Season table holds a non-finite COUNT for site '" + row.site_id + "'.");
		}
		if (!seen.emplace(row.species, row.site_id, row.day_since).second) {
			throw InputContractError("Season table repeats DAY_SINCE " + std::to_string(row.day_since) +
			                         " for site '" + row.site_id + "'.");
		}
	}
}

const std::string &SeasonTable::species() const {
	if (rows_.empty()) {
		throw InputContractError("Season table is empty.");
	}
	return rows_.front().species;
}

std::vector<std::string> SeasonTable::speciesList() const {
	std::vector<std::string> result;
	std::unordered_set<std::string> seen;
	for (const auto &row : rows_) {
		if (seen.insert(row.species).second) {
			result.push_back(row.species);
		}
	}
	return result;
}

std::vector<int> SeasonTable::years() const {
	std::vector<int> result;
	std::unordered_set<int> seen;
	for (const auto &row : rows_) {
		if (seen.insert(row.m_year).second) {
			result.push_back(row.m_year);
		}
	}
	return result;
}

std::vector<std::string> SeasonTable::sites() const {
	std::vector<std::string> result;
	std::unordered_set<std::string> seen;
	for (const auto &row : rows_) {
		if (seen.insert(row.site_id).second) {
			result.push_back(row.site_id);
		}
	}
	return result;
}

SeasonTable SeasonTable::completeSeasonsOnly() const {
	std::vector<SeasonCount> rows;
	std::copy_if(rows_.begin(), rows_.end(), std::back_inserter(rows),
	             [](const SeasonCount &row) { return row.complete_season; });
	return SeasonTable(std::move(rows));
}

SeasonTable SeasonTable::forSpecies(const std::string &species) const {
	std::vector<SeasonCount> rows;
	std::copy_if(rows_.begin(), rows_.end(), std::back_inserter(rows),
	             [&species](const SeasonCount &row) { return row.species == species; });
	return SeasonTable(std::move(rows));
}

SeasonTable SeasonTable::forYears(const std::vector<int> &years) const {
	const std::unordered_set<int> wanted(years.begin(), years.end());
	std::vector<SeasonCount> rows;
	std::copy_if(rows_.begin(), rows_.end(), std::back_inserter(rows),
	             [&wanted](const SeasonCount &row) { return wanted.count(row.m_year) > 0; });
	return SeasonTable(std::move(rows));
}

} // namespace phenoindex::core
