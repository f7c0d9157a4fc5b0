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
#include <queue>
#include <set>

#include <pkgformula/selection.hpp>
#include <pkgformula/universe.hpp>

namespace pkgformula {

const Version* Selection::get(const string& packageName) const
{
	auto it = __versions.find(packageName);
	return (it != __versions.end()) ? &it->second : nullptr;
}

bool Selection::contains(const string& packageName) const
{
	return __versions.count(packageName);
}

void Selection::set(const string& packageName, const Version& version)
{
	auto insertResult = __versions.insert({ packageName, version });
	if (!insertResult.second)
	{
		insertResult.first->second = version;
	}
}

void Selection::erase(const string& packageName)
{
	__versions.erase(packageName);
}

string Selection::toString() const
{
	vector< string > parts;
	for (const auto& item: __versions)
	{
		parts.push_back(item.first + ' ' + item.second.toString());
	}
	return join(", ", parts);
}

bool Selection::operator==(const Selection& other) const
{
	if (__versions.size() != other.__versions.size())
	{
		return false;
	}
	return std::equal(__versions.begin(), __versions.end(), other.__versions.begin(),
			[](const std::pair< const string, Version >& left, const std::pair< const string, Version >& right)
			{
				return left.first == right.first && left.second.toString() == right.second.toString();
			});
}

namespace {

// collects packages which make the formula true, following the way the evaluation goes
void __collect_used_packages(const Formula& root, const Selection& selection,
		vector< string >& result)
{
	vector< const Formula* > pending = { &root };
	while (!pending.empty())
	{
		const Formula& formula = *pending.back();
		pending.pop_back();
		switch (formula.type)
		{
			case Formula::Types::Package:
				if (formula.isSatisfiedBy(selection) &&
						std::find(result.begin(), result.end(), formula.packageName) == result.end())
				{
					result.push_back(formula.packageName);
				}
				break;
			case Formula::Types::And:
				pending.push_back(formula.right.get());
				pending.push_back(formula.left.get());
				break;
			case Formula::Types::Or:
				// only the branch which decided the disjunction
				pending.push_back(formula.left->isSatisfiedBy(selection) ?
						formula.left.get() : formula.right.get());
				break;
			case Formula::Types::Not:
				break;
		}
	}
}

}

std::map< string, vector< string > > getDependencyGraph(
		const Universe& universe, const Selection& selection)
{
	std::map< string, vector< string > > result;
	for (const auto& item: selection)
	{
		auto& neighbours = result[item.first];
		auto entry = universe.getEntry(item.first, item.second);
		if (entry && entry->formula)
		{
			__collect_used_packages(*entry->formula, selection, neighbours);
		}
	}
	return result;
}

vector< string > getDependencyChain(const Universe& universe,
		const Selection& selection, const string& root, const string& target)
{
	if (!selection.contains(root) || !selection.contains(target))
	{
		return vector< string >();
	}

	auto graph = getDependencyGraph(universe, selection);

	// breadth-first search, so the first found chain is the shortest one
	std::map< string, string > parents;
	std::set< string > visited = { root };
	std::queue< string > queue;
	queue.push(root);
	while (!queue.empty() && !visited.count(target))
	{
		auto current = queue.front();
		queue.pop();
		for (const auto& neighbour: graph[current])
		{
			if (visited.insert(neighbour).second)
			{
				parents[neighbour] = current;
				queue.push(neighbour);
			}
		}
	}

	vector< string > result;
	if (visited.count(target))
	{
		for (string current = target; current != root; current = parents[current])
		{
			result.push_back(current);
		}
		result.push_back(root);
		std::reverse(result.begin(), result.end());
	}
	return result;
}

}
