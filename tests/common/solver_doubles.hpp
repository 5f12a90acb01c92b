#pragma once

#include "pheno-index/stats/gam.hpp"
#include "pheno-index/stats/glm.hpp"

#include <memory>
#include <vector>

namespace tests::helpers {

/// Records every curve problem and forwards it to a real solver.
class RecordingCurveSolver : public phenoindex::stats::ICurveSolver {
public:
	explicit RecordingCurveSolver(int failures_before_success = 0) : failures_left_(failures_before_success) {
	}

	phenoindex::stats::GamFitResult fit(const phenoindex::stats::GamProblem &problem) override {
		problems.push_back(problem);
		if (failures_left_ != 0) {
			if (failures_left_ > 0) {
				--failures_left_;
			}
			return phenoindex::stats::FitFailure {"forced failure"};
		}
		return inner_.fit(problem);
	}

	/// Fail every call.
	static std::shared_ptr<RecordingCurveSolver> alwaysFailing() {
		return std::make_shared<RecordingCurveSolver>(-1);
	}

	std::vector<phenoindex::stats::GamProblem> problems;

private:
	int failures_left_;
	phenoindex::stats::GamSolver inner_;
};

/// Records every GLM problem and forwards it to a real solver unless told to fail.
class RecordingGlmSolver : public phenoindex::stats::IGlmSolver {
public:
	explicit RecordingGlmSolver(bool fail = false) : fail_(fail) {
	}

	phenoindex::stats::GlmFitResult fit(const phenoindex::stats::GlmProblem &problem) override {
		problems.push_back(problem);
		if (fail_) {
			return phenoindex::stats::FitFailure {"forced failure"};
		}
		return inner_.fit(problem);
	}

	std::vector<phenoindex::stats::GlmProblem> problems;

private:
	bool fail_;
	phenoindex::stats::GlmSolver inner_;
};

} // namespace tests::helpers
