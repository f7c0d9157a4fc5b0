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
#include <pkgformula/resolver.hpp>

#include <internal/logger.hpp>
#include <internal/resolverimpl.hpp>

namespace pkgformula {

Conflict::Conflict()
	: reason(Reasons::None)
{}

namespace {

string __get_dependency_description(const Conflict& conflict)
{
	if (!conflict.packageName.empty())
	{
		auto result = string("\"") + conflict.packageName + '"';
		if (!conflict.constraints.empty())
		{
			result += " {" + constraintsToString(conflict.constraints) + "}";
		}
		return result;
	}
	return conflict.dependency ? conflict.dependency->toString() : string();
}

}

string Conflict::toString() const
{
	string requester;
	if (requiredByName.empty())
	{
		requester = __("the request");
	}
	else
	{
		requester = format2("'%s %s'", requiredByName, requiredByVersion);
	}

	string result;
	switch (reason)
	{
		case Reasons::None:
			return __("no conflict");
		case Reasons::UnknownPackage:
			result = format2(__("the package '%s' is unknown, but %s depends on it"),
					packageName, requester);
			break;
		case Reasons::NoCandidate:
			result = format2(__("no version of the package '%s' satisfies '%s', required by %s"),
					packageName, __get_dependency_description(*this), requester);
			break;
		case Reasons::ConstraintViolated:
		{
			auto selectedVersion = partialSelection.get(packageName);
			result = format2(__("the selected version '%s %s' does not satisfy '%s', required by %s"),
					packageName, selectedVersion ? selectedVersion->toString() : string("?"),
					__get_dependency_description(*this), requester);
			break;
		}
		case Reasons::NegationViolated:
			result = format2(__("the negation '%s' of %s does not hold"),
					__get_dependency_description(*this), requester);
			break;
		case Reasons::Unsatisfied:
			result = format2(__("the dependencies '%s' of %s are not satisfied"),
					__get_dependency_description(*this), requester);
			break;
		case Reasons::StepLimit:
			return __("the resolver step limit is exceeded");
	}

	if (path.size() > 1)
	{
		result += format2(__(" (dependency chain: %s)"), join(" -> ", path));
	}
	return result;
}

Resolver::Result::Result()
	: outcome(Outcome::Exhausted), stepCount(0), backtrackCount(0)
{}

Resolver::Resolver(const Config& config)
	: __config(config)
{}

auto Resolver::resolve(const Universe& universe, const string& rootName,
		const vector< Constraint >& rootConstraints,
		const CancellationCheck& cancellationCheck) const -> Result
{
	checkPackageName(rootName);

	internal::Logger logger(__config);
	internal::ResolverImpl impl(__config, universe, cancellationCheck, logger);
	return impl.resolve(rootName, rootConstraints);
}

Resolver::Result resolve(const Universe& universe, const string& rootName,
		const vector< Constraint >& rootConstraints,
		const Resolver::CancellationCheck& cancellationCheck)
{
	return Resolver(Config()).resolve(universe, rootName, rootConstraints, cancellationCheck);
}

}
