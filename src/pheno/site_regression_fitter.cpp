#include "pheno-index/pheno/site_regression_fitter.hpp"

#include "pheno-index/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace phenoindex::pheno {

bool phenologyBlocksRegression(const std::vector<core::ImputedCount> &year_rows) {
	return std::any_of(year_rows.begin(), year_rows.end(), [](const core::ImputedCount &row) {
		return !row.nm && row.trim_day_no != kLeapTrimDay;
	});
}

SiteRegressionFitter::SiteRegressionFitter(std::shared_ptr<stats::IGlmSolver> solver, SiteRegressionOptions options)
    : solver_(std::move(solver)), options_(options) {
	if (!solver_) {
		throw std::invalid_argument("SiteRegressionFitter requires a GLM solver.");
	}
}

SiteRegressionResult SiteRegressionFitter::fit(std::vector<core::ImputedCount> &year_rows,
                                               std::vector<Diagnostic> &diagnostics) const {
	SiteRegressionResult result;
	if (year_rows.empty()) {
		return result;
	}

	const std::string species = year_rows.front().season.species;
	const int year = year_rows.front().season.m_year;

	std::vector<std::string> order;
	std::unordered_map<std::string, double> totals;
	for (const auto &row : year_rows) {
		auto inserted = totals.emplace(row.season.site_id, 0.0);
		if (inserted.second) {
			order.push_back(row.season.site_id);
		}
		if (row.season.count) {
			inserted.first->second += *row.season.count;
		}
	}
	std::unordered_map<std::string, Eigen::Index> site_column;
	for (const auto &site : order) {
		if (totals.at(site) > 0.0) {
			site_column.emplace(site, static_cast<Eigen::Index>(result.nonzero_sites.size()));
			result.nonzero_sites.push_back(site);
		} else {
			result.zero_sites.push_back(site);
		}
	}

	const bool blocked = phenologyBlocksRegression(year_rows);
	if (blocked) {
		report(diagnostics, DiagnosticKind::RegressionSkipped, species, year,
		       "no site regression fitted, the flight curve is incomplete");
	} else if (result.nonzero_sites.empty()) {
		PHENO_INFO("No site with a positive count for {} in {}, every fitted value is zero", species, year);
	} else {
		PHENO_INFO("Computing abundance indices for {} in {} across {} sites, using {} regression", species, year,
		           order.size(), stats::familyName(options_.family));
	}

	if (!blocked && !result.nonzero_sites.empty()) {
		result.attempted = true;

		std::vector<std::size_t> members;
		for (std::size_t i = 0; i < year_rows.size(); ++i) {
			if (site_column.count(year_rows[i].season.site_id) > 0) {
				members.push_back(i);
			}
		}

		const bool raw_offset = options_.family == stats::Family::NegativeBinomial;
		const bool single = result.nonzero_sites.size() == 1;
		// A single negative binomial site has no coefficient at all.
		const Eigen::Index columns =
		    single && raw_offset ? 0 : static_cast<Eigen::Index>(result.nonzero_sites.size());
		const auto n = static_cast<Eigen::Index>(members.size());
		const double nan = std::numeric_limits<double>::quiet_NaN();

		stats::GlmProblem problem;
		problem.family = options_.family;
		problem.control.max_iterations = options_.max_iterations;
		problem.design = Eigen::MatrixXd::Zero(n, columns);
		problem.response.resize(n);
		problem.offset.resize(n);
		for (Eigen::Index r = 0; r < n; ++r) {
			const auto &row = year_rows[members[static_cast<std::size_t>(r)]];
			if (columns > 0) {
				problem.design(r, site_column.at(row.season.site_id)) = 1.0;
			}
			problem.response[r] = row.season.count ? *row.season.count : nan;
			if (!row.nm) {
				problem.offset[r] = nan;
			} else {
				problem.offset[r] = raw_offset ? *row.nm : std::log(*row.nm);
			}
		}

		result.model = solver_->fit(problem);
		if (stats::succeeded(result.model)) {
			const auto fitted = std::get<stats::GlmModel>(result.model).predict(problem.design, problem.offset);
			for (Eigen::Index r = 0; r < n; ++r) {
				auto &row = year_rows[members[static_cast<std::size_t>(r)]];
				if (std::isfinite(fitted[r])) {
					row.fitted = fitted[r];
				} else {
					row.fitted.reset();
				}
			}
		} else {
			for (auto index : members) {
				year_rows[index].fitted.reset();
				year_rows[index].count_imputed.reset();
			}
			report(diagnostics, DiagnosticKind::FitFailure, species, year,
			       "site regression failed (" + std::get<stats::FitFailure>(result.model).reason +
			           "), verify the data provided for that year");
		}
	} else {
		result.model = stats::FitFailure {"No site regression fitted for " + std::to_string(year) + "."};
	}

	for (auto &row : year_rows) {
		if (site_column.count(row.season.site_id) == 0) {
			row.fitted = 0.0;
		}
	}
	return result;
}

} // namespace phenoindex::pheno
