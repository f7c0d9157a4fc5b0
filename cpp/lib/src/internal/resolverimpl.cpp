/**************************************************************************
*   Copyright (C) 2026 by the pkgformula developers                       *
*                                                                         *
*   This program is free software; you can redistribute it and/or modify  *
*   it under the terms of the GNU General Public License                  *
*   (version 3 or above) as published by the Free Software Foundation.    *
*                                                                         *
*   This program is distributed in the hope that it will be useful,       *
*   but WITHOUT ANY WARRANTY; without even the implied warranty of        *
*   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the         *
*   GNU General Public License for more details.                          *
*                                                                         *
*   You should have received a copy of the GNU GPL                        *
*   along with this program; if not, write to the                         *
*   Free Software Foundation, Inc.,                                       *
*   51 Franklin St, Fifth Floor, Boston, MA 02110-1301, USA               *
**************************************************************************/
#include <algorithm>

#include <internal/resolverimpl.hpp>

namespace pkgformula {
namespace internal {

namespace {

size_t __get_max_step_count(const Config& config)
{
	const char* optionName = "pkgformula::resolver::max-steps";
	auto value = config.getInteger(optionName);
	if (value < 0)
	{
		fatal2(__("the option '%s' cannot be negative"), optionName);
	}
	return value;
}

}

ResolverImpl::ResolverImpl(const Config& config, const Universe& universe,
		const Resolver::CancellationCheck& cancellationCheck, Logger& logger)
	: __universe(universe), __cancellation_check(cancellationCheck), __logger(logger),
	__debugging(config.getBool("debug::resolver")),
	__max_step_count(__get_max_step_count(config)),
	__step_count(0), __backtrack_count(0), __cancelled(false)
{}

template < typename... Args >
void ResolverImpl::__mydebug_wrapper(const char* format, const Args&... args) const
{
	string levelString(__choice_points.size(), ' ');
	debug2("%s%s", levelString, format2(format, args...));
}

bool ResolverImpl::__is_cancelled() const
{
	return __cancellation_check && __cancellation_check();
}

vector< string > ResolverImpl::__get_path(const string& requiredBy) const
{
	vector< string > result;
	string current = requiredBy;
	while (!current.empty())
	{
		result.push_back(current);
		auto it = __state.introducedBy.find(current);
		if (it == __state.introducedBy.end())
		{
			break;
		}
		current = it->second;
	}
	std::reverse(result.begin(), result.end());
	return result;
}

string ResolverImpl::__get_requester_description(const string& requiredBy) const
{
	if (requiredBy.empty())
	{
		return __("the request");
	}
	auto version = __state.selection.get(requiredBy);
	return version ? format2("%s %s", requiredBy, version->toString()) : requiredBy;
}

void ResolverImpl::__record_conflict(Reasons::Type reason, const Goal& goal,
		const string& packageName, const vector< Constraint >& constraints)
{
	if (__debugging)
	{
		__mydebug_wrapper("problem: '%s' of %s",
				goal.formula->toString(), __get_requester_description(goal.requiredBy));
	}

	// the deepest failure is the most informative one
	if (__deepest_conflict.reason != Reasons::None &&
			__state.selection.size() <= __deepest_conflict.partialSelection.size())
	{
		return;
	}

	Conflict conflict;
	conflict.reason = reason;
	conflict.packageName = packageName;
	conflict.constraints = constraints;
	conflict.dependency = goal.formula;
	conflict.requiredByName = goal.requiredBy;
	if (auto requiredByVersion = __state.selection.get(goal.requiredBy))
	{
		conflict.requiredByVersion = requiredByVersion->toString();
	}
	conflict.partialSelection = __state.selection;
	conflict.path = __get_path(goal.requiredBy);

	__deepest_conflict = std::move(conflict);
}

vector< Constraint > ResolverImpl::__get_pending_constraints(const string& packageName) const
{
	vector< Constraint > result;

	// only conjunctions make a dependency mandatory
	vector< const Formula* > stack;
	for (const auto& goal: __state.agenda)
	{
		stack.push_back(goal.formula.get());
	}
	while (!stack.empty())
	{
		auto formula = stack.back();
		stack.pop_back();
		if (formula->type == Formula::Types::And)
		{
			stack.push_back(formula->left.get());
			stack.push_back(formula->right.get());
		}
		else if (formula->type == Formula::Types::Package && formula->packageName == packageName)
		{
			result.insert(result.end(), formula->constraints.begin(), formula->constraints.end());
		}
	}

	return result;
}

bool ResolverImpl::__check_positive_negations()
{
	for (const auto& negation: __state.negations)
	{
		const auto& inner = negation.formula->left;
		// without nested negations the formula cannot become false again
		if (!inner->containsNegation() && inner->isSatisfiedBy(__state.selection))
		{
			__record_conflict(Reasons::NegationViolated, negation);
			return false;
		}
	}
	return true;
}

bool ResolverImpl::__commit_version(const Goal& goal, const Version& version)
{
	const auto& packageName = goal.formula->packageName;

	auto entry = __universe.getEntry(packageName, version);
	if (!entry)
	{
		fatal2i("resolver: no version '%s' of the package '%s'", version.toString(), packageName);
	}

	__state.selection.set(packageName, version);
	__state.introducedBy[packageName] = goal.requiredBy;
	if (__debugging)
	{
		__mydebug_wrapper("selected '%s %s'", packageName, version.toString());
	}
	__logger.log(Logger::Subsystem::Resolver, 2,
			format2("selected '%s %s'", packageName, version.toString()));

	if (entry->formula)
	{
		__state.agenda.push_back(Goal{ entry->formula, packageName });
	}
	return __check_positive_negations();
}

bool ResolverImpl::__apply_next_alternative()
{
	while (!__choice_points.empty())
	{
		if (__is_cancelled())
		{
			__cancelled = true;
			return false;
		}

		auto& choicePoint = __choice_points.back();
		size_t alternativeCount = (choicePoint.kind == ChoicePoint::Kinds::Versions) ?
				choicePoint.candidates.size() : 2;
		if (choicePoint.nextAlternative == alternativeCount)
		{
			__choice_points.pop_back();
			continue;
		}

		auto alternative = choicePoint.nextAlternative++;
		__state = choicePoint.state;
		if (alternative > 0)
		{
			++__backtrack_count;
			__logger.log(Logger::Subsystem::Resolver, 3,
					format2("backtracking to '%s'", choicePoint.goal.formula->toString()));
		}

		if (choicePoint.kind == ChoicePoint::Kinds::Versions)
		{
			auto goal = choicePoint.goal;
			auto version = choicePoint.candidates[alternative];
			if (__debugging)
			{
				__mydebug_wrapper("trying '%s %s' for '%s'", goal.formula->packageName,
						version.toString(), goal.formula->toString());
			}
			if (__commit_version(goal, version))
			{
				return true;
			}
		}
		else
		{
			const auto& formula = *choicePoint.goal.formula;
			const auto& branch = (alternative == 0) ? formula.left : formula.right;
			if (__debugging)
			{
				__mydebug_wrapper("trying the %s branch '%s'",
						(alternative == 0) ? "left" : "right", branch->toString());
			}
			__state.agenda.push_back(Goal{ branch, choicePoint.goal.requiredBy });
			return true;
		}
	}
	return false;
}

bool ResolverImpl::__open_choice_point(ChoicePoint::Kinds::Type kind, const Goal& goal,
		vector< Version >&& candidates)
{
	if (__is_cancelled())
	{
		__cancelled = true;
		return false;
	}

	ChoicePoint choicePoint;
	choicePoint.state = __state;
	choicePoint.kind = kind;
	choicePoint.goal = goal;
	choicePoint.candidates = std::move(candidates);
	choicePoint.nextAlternative = 0;
	__choice_points.push_back(std::move(choicePoint));

	return __apply_next_alternative();
}

bool ResolverImpl::__process_package_goal(const Goal& goal)
{
	const auto& formula = *goal.formula;
	const auto& packageName = formula.packageName;

	if (auto selectedVersion = __state.selection.get(packageName))
	{
		if (satisfiesAll(formula.constraints, *selectedVersion))
		{
			return true;
		}
		__record_conflict(Reasons::ConstraintViolated, goal, packageName, formula.constraints);
		return false;
	}

	if (!__universe.hasPackage(packageName))
	{
		__record_conflict(Reasons::UnknownPackage, goal, packageName, formula.constraints);
		return false;
	}

	auto constraints = formula.constraints;
	auto pendingConstraints = __get_pending_constraints(packageName);
	constraints.insert(constraints.end(), pendingConstraints.begin(), pendingConstraints.end());

	vector< Version > candidates;
	for (const auto& entry: __universe.getEntries(packageName))
	{
		if (satisfiesAll(constraints, entry.version))
		{
			candidates.push_back(entry.version);
		}
	}
	if (candidates.empty())
	{
		__record_conflict(Reasons::NoCandidate, goal, packageName, constraints);
		return false;
	}

	return __open_choice_point(ChoicePoint::Kinds::Versions, goal, std::move(candidates));
}

bool ResolverImpl::__process_goal(const Goal& goal)
{
	switch (goal.formula->type)
	{
		case Formula::Types::Package:
			return __process_package_goal(goal);
		case Formula::Types::And:
			__state.agenda.push_back(Goal{ goal.formula->right, goal.requiredBy });
			__state.agenda.push_back(Goal{ goal.formula->left, goal.requiredBy });
			return true;
		case Formula::Types::Or:
			return __open_choice_point(ChoicePoint::Kinds::Branches, goal, vector< Version >());
		case Formula::Types::Not:
		{
			const auto& inner = goal.formula->left;
			if (!inner->containsNegation() && inner->isSatisfiedBy(__state.selection))
			{
				__record_conflict(Reasons::NegationViolated, goal);
				return false;
			}
			__state.negations.push_back(goal);
			return true;
		}
	}
	fatal2i("resolver: unknown formula type %d", int(goal.formula->type));
	__builtin_unreachable();
}

bool ResolverImpl::__verify_final_selection()
{
	for (const auto& item: __state.selection)
	{
		auto entry = __universe.getEntry(item.first, item.second);
		if (!entry)
		{
			fatal2i("resolver: selected '%s %s' is not in the universe",
					item.first, item.second.toString());
		}
		if (entry->formula && !entry->formula->isSatisfiedBy(__state.selection))
		{
			__record_conflict(Reasons::Unsatisfied, Goal{ entry->formula, item.first });
			return false;
		}
	}
	for (const auto& negation: __state.negations)
	{
		if (negation.formula->left->isSatisfiedBy(__state.selection))
		{
			__record_conflict(Reasons::NegationViolated, negation);
			return false;
		}
	}
	return true;
}

auto ResolverImpl::resolve(const string& rootName, const vector< Constraint >& rootConstraints) -> Result
{
	Result result;

	Goal rootGoal{ Formula::makePackage(rootName, rootConstraints), string() };
	__logger.log(Logger::Subsystem::Resolver, 1,
			format2("resolving '%s'", rootGoal.formula->toString()));
	if (__debugging)
	{
		debug2("started resolving '%s'", rootGoal.formula->toString());
	}

	__state.agenda.push_back(rootGoal);
	while (true)
	{
		bool success;
		if (__state.agenda.empty())
		{
			success = __verify_final_selection();
			if (success)
			{
				result.outcome = Outcome::Solved;
				result.selection = __state.selection;
				break;
			}
		}
		else
		{
			if (__max_step_count && __step_count >= __max_step_count)
			{
				result.outcome = Outcome::Exhausted;
				result.conflict.reason = Reasons::StepLimit;
				result.conflict.partialSelection = __state.selection;
				break;
			}
			++__step_count;

			auto goal = std::move(__state.agenda.back());
			__state.agenda.pop_back();
			success = __process_goal(goal);
		}

		if (!success && !__cancelled)
		{
			success = __apply_next_alternative();
			if (!success && !__cancelled)
			{
				result.outcome = Outcome::Exhausted;
				result.conflict = __deepest_conflict;
				break;
			}
		}
		if (__cancelled)
		{
			result.outcome = Outcome::Cancelled;
			break;
		}
	}

	result.stepCount = __step_count;
	result.backtrackCount = __backtrack_count;

	switch (result.outcome)
	{
		case Outcome::Solved:
			__logger.log(Logger::Subsystem::Resolver, 1,
					format2("solved: %s", result.selection.toString()));
			break;
		case Outcome::Exhausted:
			__logger.log(Logger::Subsystem::Resolver, 1,
					format2("no solution: %s", result.conflict.toString()));
			break;
		case Outcome::Cancelled:
			__logger.log(Logger::Subsystem::Resolver, 1, "cancelled");
			break;
	}
	if (__debugging)
	{
		debug2("finished resolving: %zu steps, %zu backtracks", __step_count, __backtrack_count);
	}

	return result;
}

}
}
