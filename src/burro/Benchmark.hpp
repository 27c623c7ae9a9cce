/* Burro a fixed-layout typesetting compiler
   Copyright © 2023 ef3d0c3e

   This program is free software: you can redistribute it and/or modify
   it under the terms of the GNU Affero General Public License as
   published by the Free Software Foundation, either version 3 of the
   License, or any later version.

   This program is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
   GNU Affero General Public License for more details.

   You should have received a copy of the GNU Affero General Public License
   along with this program.  If not, see <http://www.gnu.org/licenses/>. */

#ifndef BURRO_BENCHMARK_HPP
#define BURRO_BENCHMARK_HPP

#include <deque>
#include <stack>
#include <chrono>
#include <string>

using BenchDur = std::chrono::duration<double, std::micro>;

/**
 * @brief Timing of a compilation stage
 */
class BenchmarkResult
{
	std::string m_name; ///< Stage name
	BenchDur m_dur{}; ///< Stage duration
	std::deque<BenchmarkResult> m_sub; ///< Nested stages
public:
	/**
	 * @brief Constructor
	 *
	 * @param name Stage name
	 */
	BenchmarkResult(std::string&& name):
		m_name{std::move(name)} {}

	void setDuration(BenchDur dur) { m_dur = dur; }
	[[nodiscard]] BenchDur getDuration() const { return m_dur; }
	[[nodiscard]] const std::string& getName() const { return m_name; }
	[[nodiscard]] const std::deque<BenchmarkResult>& getSub() const { return m_sub; }

	/**
	 * @brief Gets duration of nested stages
	 *
	 * @return Sum of the durations of every nested stage
	 */
	[[nodiscard]] BenchDur getSubDuration() const;

	void addSub(BenchmarkResult&& sub) { m_sub.push_back(std::move(sub)); }

	/**
	 * @brief Displays stage and nested stages
	 *
	 * Nested stages show their share of the parent's duration
	 *
	 * @params depth Maximum depth (default = infinite depth)
	 * @return Formatted tree of durations
	 */
	[[nodiscard]] std::string display(std::size_t depth = -1) const;
};

/**
 * @brief Records stage timings as a tree
 */
class Benchmark
{
	std::chrono::steady_clock m_clk; ///< Clock used for benchmarking

	std::deque<BenchmarkResult> m_results; ///< Finished root stages
	std::stack<BenchmarkResult> m_benchStack; ///< Running stages
	std::stack<std::chrono::time_point<decltype(m_clk)>> m_timeStack; ///< Start time of running stages

public:
	/**
	 * @brief Starts a stage
	 *
	 * @param name Stage name
	 */
	void push(std::string&& name);

	/**
	 * @brief Stops last started stage
	 */
	void pop();

	/**
	 * @brief Removes every finished stage
	 */
	void clear() { m_results.clear(); }

	[[nodiscard]] const std::deque<BenchmarkResult>& results() const { return m_results; }

	/**
	 * @brief Displays every finished stage
	 *
	 * @params depth Maximum depth (default = infinite depth)
	 * @return Formatted tree of durations
	 */
	[[nodiscard]] std::string display(std::size_t depth = -1) const;
};

extern Benchmark Benchmarker;

/**
 * @brief Times the enclosing scope
 */
class BenchmarkScope
{
	Benchmark& m_bench;
public:
	[[nodiscard]] BenchmarkScope(std::string&& name, Benchmark& bench = Benchmarker):
		m_bench{bench}
	{
		m_bench.push(std::move(name));
	}

	~BenchmarkScope() { m_bench.pop(); }

	BenchmarkScope(const BenchmarkScope&) = delete;
	BenchmarkScope& operator=(const BenchmarkScope&) = delete;
};

#endif // BURRO_BENCHMARK_HPP
