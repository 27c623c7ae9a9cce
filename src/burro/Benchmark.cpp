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

#include "Benchmark.hpp"
#include <functional>
#include <fmt/format.h>
#include <fmt/chrono.h>

Benchmark Benchmarker{};

[[nodiscard]] BenchDur BenchmarkResult::getSubDuration() const
{
	BenchDur dur{};
	for (const auto& bench : m_sub)
		dur += bench.m_dur;

	return dur;
}

[[nodiscard]] std::string BenchmarkResult::display(std::size_t depth) const
{
	std::function<void(std::string&, const BenchmarkResult&, BenchDur, std::size_t)> walk =
		[&walk, depth](std::string& s, const BenchmarkResult& bench, BenchDur parent, std::size_t d)
	{
		s.append(std::string(2*d, ' '));
		if (d == 0)
			s.append(fmt::format("{} [{:.3}]\n", bench.m_name, bench.m_dur));
		else
		{
			const double share = parent.count() > 0.0 ? 100.0 * bench.m_dur / parent : 0.0;
			s.append(fmt::format("{} [{:.3}, {:.1f}%]\n", bench.m_name, bench.m_dur, share));
		}

		if (bench.m_sub.empty() || depth == d)
			return;

		for (const auto& sub : bench.m_sub)
			walk(s, sub, bench.m_dur, d+1);

		const BenchDur rest = bench.m_dur - bench.getSubDuration();
		s.append(std::string(2*(d+1), ' ')).append(fmt::format("(other) [{:.3}]\n", rest));
	};

	std::string s;
	walk(s, *this, m_dur, 0);
	return s;
}

void Benchmark::push(std::string&& name)
{
	m_benchStack.push(BenchmarkResult{std::move(name)});
	m_timeStack.push(m_clk.now());
}

void Benchmark::pop()
{
	const BenchDur d = m_clk.now() - m_timeStack.top();
	m_timeStack.pop();

	BenchmarkResult bench = std::move(m_benchStack.top());
	m_benchStack.pop();

	bench.setDuration(d);
	if (m_benchStack.empty())
		m_results.push_back(std::move(bench));
	else
		m_benchStack.top().addSub(std::move(bench));
}

[[nodiscard]] std::string Benchmark::display(std::size_t depth) const
{
	std::string s;
	for (const auto& res : m_results)
		s.append(res.display(depth));

	return s;
}
