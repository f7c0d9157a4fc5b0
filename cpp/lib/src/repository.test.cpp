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
#include <cstdlib>

#include <sys/stat.h>

#include <pkgformula/file.hpp>
#include <pkgformula/repository.hpp>
#include <pkgformula/resolver.hpp>

#include <catch2/catch.hpp>

using namespace pkgformula;

namespace {

class TemporaryDirectory
{
	string __path;
 public:
	TemporaryDirectory()
	{
		char pattern[] = "/tmp/pkgformula-test.XXXXXX";
		if (!mkdtemp(pattern))
		{
			throw Exception("unable to create a temporary directory");
		}
		__path = pattern;
	}
	~TemporaryDirectory()
	{
		auto command = string("rm -rf '") + __path + "'";
		if (system(command.c_str()) != 0)
		{
			WARN("unable to remove " << __path);
		}
	}
	const string& getPath() const { return __path; }

	void addFile(const string& relativePath, const string& content)
	{
		size_t position = 0;
		while ((position = relativePath.find('/', position)) != string::npos)
		{
			mkdir((__path + '/' + relativePath.substr(0, position)).c_str(), 0755);
			++position;
		}
		RequiredFile(__path + '/' + relativePath, "w").put(content);
	}
};

}

TEST_CASE("Reading opam files")
{
	auto record = parseOpamFile(
			"opam-version: \"2.0\"\n"
			"name: \"A\"\n"
			"version: \"2.0.0\"\n"
			"depends: [\n"
			"  \"B\" {> \"1.2.0\"} # the new API\n"
			"  ( \"C\" | \"D\" {= \"2.0.0\"} )\n"
			"]\n"
			"synopsis: \"[not a dependency]\"\n",
			"packages/A/A.2.0.0/opam");
	CHECK(record.name == "A");
	CHECK(record.versionString == "2.0.0");
	CHECK(parseFormulaList(record.formulaText)->toString() ==
			"\"B\" {> \"1.2.0\"} & (\"C\" | \"D\" {= \"2.0.0\"})");
	CHECK(record.origin == "packages/A/A.2.0.0/opam");
}

TEST_CASE("Opam file fallbacks and errors")
{
	auto record = parseOpamFile("opam-version: \"2.0\"\n", "packages/foo/foo.1.2/opam");
	CHECK(record.name == "foo");
	CHECK(record.versionString == "1.2");
	CHECK(record.formulaText.empty());

	CHECK_THROWS_AS(parseOpamFile("depends: [ \"A\"\n", "packages/a/a.1/opam"), Exception);
	CHECK_THROWS_AS(parseOpamFile("name: \"a\"\n", "opam"), Exception);
}

TEST_CASE("Reading a repository")
{
	TemporaryDirectory directory;
	directory.addFile("packages/A/A.1.0.0/opam", "name: \"A\"\nversion: \"1.0.0\"\ndepends: [ \"B\" ]\n");
	directory.addFile("packages/A/A.2.0.0/opam", "depends: [ \"B\" {>= \"2\"} ]\n");
	directory.addFile("packages/B/B.2/opam", "");
	directory.addFile("packages/B/B.3/opam", "depends: [ \"C\"\n");

	auto records = readRepository(directory.getPath());
	REQUIRE(records.size() == 3);
	CHECK(records[0].versionString == "1.0.0");
	CHECK(records[1].versionString == "2.0.0");
	CHECK(records[2].name == "B");

	auto universe = loadUniverse(records);
	CHECK(universe.getVersionCount() == 3);
	CHECK(resolve(universe, "A").isSolved());

	CHECK_THROWS_AS(readRepository(directory.getPath() + "/missing"), Exception);
}
