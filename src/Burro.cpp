#include <cxxopts.hpp>
#include <clocale>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <memory>
#include <iostream>

#include "burro/Util.hpp"
#include "burro/Pipeline.hpp"
#include "burro/FontMap.hpp"
#include "burro/Benchmark.hpp"
#include "burro/TextEmitter.hpp"
#include "burro/PdfEmitter.hpp"



int main(int argc, char* argv[])
{
	std::setlocale(LC_ALL, "en_US.UTF-8");
	cxxopts::Options opts("burro", "Burro, a fixed-layout typesetting compiler");

	std::string command, in_file, out_file, font_map, emitter;
	std::vector<std::string> printing;
	opts.add_options()
		("h,help",    "Displays help", cxxopts::value<bool>()->default_value("false"))
		("v,version", "Displays version", cxxopts::value<bool>()->default_value("false"))
		("command", "Command to run (compile)", cxxopts::value<std::string>(command))
		("input", "Sets source file", cxxopts::value<std::string>(in_file))
		("o,output", "Sets output file", cxxopts::value<std::string>(out_file))
		("f,font-map", "Sets font map file", cxxopts::value<std::string>(font_map))
		("e,emitter", "Sets output format (pdf, text)", cxxopts::value<std::string>(emitter)->default_value("pdf"))
		("b,benchmark", "Displays duration of each compilation stage", cxxopts::value<bool>()->default_value("false"))
		("p,print", "Prints informations (tree, vars)", cxxopts::value<std::vector<std::string>>(printing))
		("no-colors", "Disables colors in messages", cxxopts::value<bool>()->default_value("false"));
	opts.parse_positional({"command", "input"});
	opts.positional_help("compile <source-file>");

	decltype(opts.parse(argc, argv)) result;
	try
	{
		result = opts.parse(argc, argv);
	}
	catch (cxxopts::option_not_exists_exception& e)
	{
		std::cerr << e.what() << std::endl;
		std::exit(EXIT_FAILURE);
	}
	catch (cxxopts::option_syntax_exception& e)
	{
		std::cerr << e.what() << std::endl;
		std::exit(EXIT_FAILURE);
	}
	catch (cxxopts::missing_argument_exception& e)
	{
		std::cerr << e.what() << std::endl;
		std::exit(EXIT_FAILURE);
	}

	if (result.count("help"))
	{
		std::cout << opts.help() << std::endl;
		std::exit(EXIT_SUCCESS);
	}

	if (result.count("version"))
	{
		std::cout << "Burro v0.4\n"
			<< "License: GNU Affero General Public License version 3 (AGPLv3)\n"
			<< "see <https://www.gnu.org/licenses/agpl-3.0.en.html>\n"
			<< "This is free software: you are free to change and redistribute it.\n"
			<< "There is NO WARRANTY, to the extent permitted by law.\n"
			<< "\n"
			<< "Author(s):\n"
			<< " - ef3d0c3e <ef3d0c3e@pundalik.org>\n";

		std::exit(EXIT_SUCCESS);
	}

	if (result.count("no-colors"))
		Colors::enabled = false;

	if (!result.count("command") || command != "compile")
	{
		std::cerr << "Unknown command, usage: burro compile <source-file> [options]" << std::endl;
		std::exit(EXIT_FAILURE);
	}

	if (!result.count("input"))
	{
		std::cerr << "You must specify a source file." << std::endl;
		std::exit(EXIT_FAILURE);
	}

	if (emitter != "pdf" && emitter != "text")
	{
		std::cerr << "Unknown emitter: '" << emitter << "'." << std::endl;
		std::exit(EXIT_FAILURE);
	}

	const std::filesystem::path in_file_path{in_file};
	try
	{
		std::ifstream in(in_file_path);
		if (!in.good())
		{
			std::cerr << "Error: could not open file '" + in_file_path.string() + "'." << std::endl;
			return EXIT_FAILURE;
		}
		std::string content((std::istreambuf_iterator<char>(in)), (std::istreambuf_iterator<char>()));
		in.close();

		// Fonts
		std::unique_ptr<FontProvider> fonts;
		{
			BenchmarkScope bench{"Fonts"};
			std::filesystem::path map_path{font_map};
			if (!result.count("font-map"))
				map_path = in_file_path.parent_path() / "fontmap";

			if (result.count("font-map") || std::filesystem::exists(map_path))
				fonts = std::make_unique<FreeTypeFonts>(FontMap::load(map_path));
			else
				fonts = std::make_unique<BuiltinFonts>();
		}

		const File file(in_file_path.string(), content);
		const Compilation c = compile(file, *fonts);

		for (const auto& w : c.layout.warnings)
			std::cerr << w.format(file) << std::endl;

		for (const std::string& arg : printing)
		{
			if (arg == "tree")
				std::cout << c.doc.dump();
			else if (arg == "vars")
			{
				std::cout << "Variables:\n";
				c.vars.for_each([](const std::string& name, const std::vector<Token>& tokens)
				{
					std::string body;
					for (const auto& tok : tokens)
						body.append(tok.text);
					std::cout << " - '" << name << "' : `" << body << "`\n";
				});
				std::cout << "==========\n";
			}
			else [[unlikely]]
			{
				std::cerr << "Unknown printing argument : '" << arg << "'." << std::endl;
			}
		}

		// Emit to memory, the output file is only created on success
		std::ostringstream ss;
		EmitterOptions eopts{ss};
		eopts.title = in_file_path.stem().string();

		std::unique_ptr<Emitter> e;
		if (emitter == "text")
			e = std::make_unique<TextEmitter>(std::move(eopts));
		else
			e = std::make_unique<PdfEmitter>(std::move(eopts), *fonts);
		{
			BenchmarkScope bench{"Emit " + e->get_name()};
			e->emit(c.layout);
		}

		std::filesystem::path out_path{out_file};
		if (!result.count("output"))
			out_path = std::filesystem::path{in_file_path}.replace_extension(e->get_extension());

		std::ofstream out(out_path, std::ios::binary);
		if (!out.good())
		{
			std::cerr << "Unable to open output file '" << out_path.string() << "'" << std::endl;
			std::exit(EXIT_FAILURE);
		}
		const std::string res = ss.str();
		out.write(res.data(), static_cast<std::streamsize>(res.size()));
		out.close();

		if (result.count("benchmark"))
			std::cout << Benchmarker.display();
	}
	catch (Error& e)
	{
		std::cerr << e.what() << std::endl;
		std::exit(EXIT_FAILURE);
	}

	return EXIT_SUCCESS;
}
