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
#ifndef PKGFORMULA_RESOLVER_SEEN
#define PKGFORMULA_RESOLVER_SEEN

/// @file

#include <functional>

#include <pkgformula/common.hpp>
#include <pkgformula/config.hpp>
#include <pkgformula/formula.hpp>
#include <pkgformula/selection.hpp>
#include <pkgformula/universe.hpp>

namespace pkgformula {

/// the description of a resolution failure
struct PKGFORMULA_API Conflict
{
	/// failure kinds
	struct Reasons
	{
		enum Type
		{
			None, ///< no failure was recorded
			UnknownPackage, ///< a dependency names a package absent from the universe
			NoCandidate, ///< no version of the package satisfies the constraints in force
			ConstraintViolated, ///< the already selected version does not satisfy the dependency
			NegationViolated, ///< a negated formula holds under the selection
			Unsatisfied, ///< a formula of a selected version is false under the final selection
			StepLimit ///< the search step limit was exceeded
		};
	};

	Reasons::Type reason; ///< failure kind
	/// the package at issue, empty for @c NegationViolated, @c Unsatisfied and @c StepLimit
	string packageName;
	/// constraints the package had to satisfy, including those of other pending dependencies
	vector< Constraint > constraints;
	/// the dependency which failed, may be empty for @c StepLimit
	shared_ptr< const Formula > dependency;
	/// the package whose formula contains the dependency, empty for the root request
	string requiredByName;
	/// the selected version of @ref requiredByName
	string requiredByVersion;
	/// the selection at the point of failure
	Selection partialSelection;
	/// package names from the root request down to @ref requiredByName
	vector< string > path;

	Conflict();

	/// gets the human-readable description
	string toString() const;
};

/// dependency resolver
/**
 * Computes a selection of package versions, one per required package, such
 * that the formulas of all selected versions hold. The search is a depth-first
 * backtracking one, candidates are tried newest first and disjunctions left
 * first, so the result is deterministic.
 *
 * The object keeps only settings, so one resolver may be used by several
 * threads at once.
 */
class PKGFORMULA_API Resolver
{
	const Config __config;
 public:
	/// resolution outcomes
	struct Outcome
	{
		enum Type
		{
			Solved, ///< a consistent selection was found
			Exhausted, ///< there is no consistent selection, or the step limit was hit
			Cancelled ///< the caller requested the cancellation
		};
	};

	/// the result of a resolution
	struct Result
	{
		Outcome::Type outcome;
		Selection selection; ///< solution, meaningful only for @c Solved
		Conflict conflict; ///< failure description, meaningful only for @c Exhausted
		size_t stepCount; ///< number of processed dependency goals
		size_t backtrackCount; ///< number of returns to earlier choice points

		Result();
		bool isSolved() const { return outcome == Outcome::Solved; }
	};

	/// cancellation callback
	/**
	 * Called at every choice point, should return @c true to abort the search.
	 */
	typedef std::function< bool () > CancellationCheck;

	/// constructor
	/**
	 * @param config configuration, see @ref Config for resolver options
	 */
	explicit Resolver(const Config& config);

	/// resolves dependencies of the root request
	/**
	 * The function never throws for unsatisfiable input, failures are
	 * returned as @ref Conflict.
	 *
	 * @param universe available packages
	 * @param rootName name of the requested package
	 * @param rootConstraints version constraints of the request
	 * @param cancellationCheck optional cancellation callback
	 * @throw Exception if @a rootName is not a valid package name
	 */
	Result resolve(const Universe& universe, const string& rootName,
			const vector< Constraint >& rootConstraints,
			const CancellationCheck& cancellationCheck = CancellationCheck()) const;
};

/// resolves dependencies using the default configuration
/**
 * @copydetails Resolver::resolve
 */
PKGFORMULA_API Resolver::Result resolve(const Universe& universe, const string& rootName,
		const vector< Constraint >& rootConstraints = vector< Constraint >(),
		const Resolver::CancellationCheck& cancellationCheck = Resolver::CancellationCheck());

}

#endif
