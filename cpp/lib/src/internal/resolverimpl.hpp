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
#ifndef PKGFORMULA_INTERNAL_RESOLVERIMPL_SEEN
#define PKGFORMULA_INTERNAL_RESOLVERIMPL_SEEN

#include <map>

#include <pkgformula/resolver.hpp>

#include <internal/logger.hpp>

namespace pkgformula {
namespace internal {

using std::map;

// the state of one resolution, is not shared between calls
class ResolverImpl
{
	typedef Resolver::Result Result;
	typedef Resolver::Outcome Outcome;
	typedef Conflict::Reasons Reasons;

	struct Goal
	{
		shared_ptr< const Formula > formula;
		string requiredBy; // empty for the root request
	};

	struct State
	{
		Selection selection;
		map< string, string > introducedBy;
		vector< Goal > agenda; // the back is processed first
		vector< Goal > negations;
	};

	struct ChoicePoint
	{
		struct Kinds
		{
			enum Type { Versions, Branches };
		};

		State state; // before the choice
		Kinds::Type kind;
		Goal goal;
		vector< Version > candidates;
		size_t nextAlternative;
	};

	const Universe& __universe;
	const Resolver::CancellationCheck& __cancellation_check;
	Logger& __logger;
	const bool __debugging;
	const size_t __max_step_count;

	State __state;
	vector< ChoicePoint > __choice_points;
	Conflict __deepest_conflict;
	size_t __step_count;
	size_t __backtrack_count;
	bool __cancelled;

	template < typename... Args >
	void __mydebug_wrapper(const char* format, const Args&... args) const;

	bool __process_goal(const Goal&);
	bool __process_package_goal(const Goal&);
	bool __open_choice_point(ChoicePoint::Kinds::Type, const Goal&, vector< Version >&&);
	bool __apply_next_alternative();
	bool __commit_version(const Goal&, const Version&);
	bool __check_positive_negations();
	bool __verify_final_selection();
	vector< Constraint > __get_pending_constraints(const string& packageName) const;
	bool __is_cancelled() const;

	void __record_conflict(Reasons::Type, const Goal&,
			const string& packageName = string(), const vector< Constraint >& = vector< Constraint >());
	vector< string > __get_path(const string& requiredBy) const;
	string __get_requester_description(const string& requiredBy) const;
 public:
	ResolverImpl(const Config&, const Universe&, const Resolver::CancellationCheck&, Logger&);

	Result resolve(const string& rootName, const vector< Constraint >& rootConstraints);
};

}
}

#endif
