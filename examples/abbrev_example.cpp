#include <iostream>
#include <string>
#include <vector>

#include "mcli/mcli.hpp"

// build --verb              -> verbose=true
// build --create            -> ambiguous: --create-dir, --create-file
// build --create-f=out.txt  -> create_file=out.txt
// build --no-abbrev --verb  -> unknown option (abbreviations disabled)
int main(int argc, char** argv) {
    bool abbreviations = true;
    std::vector<std::string> passed;
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--no-abbrev") {
            abbreviations = false;
            continue;
        }
        passed.emplace_back(argv[i]);
    }

    mcli::Command cmd("build", "Abbreviated option example");
    cmd.spec(mcli::ArgSpecBuilder()
                 .ambiguous("target", std::string("all"))
                 .namedOnly("verbose", false)
                 .namedOnly("create_dir", std::string(""))
                 .namedOnly("create_file", std::string(""))
                 .build())
        .allowAbbreviations(abbreviations)
        .colorMode(mcli::ColorMode::Auto)
        .setArgs(passed)
        .action([](const mcli::BoundArgs& args) {
            std::cout << "target=" << args.get<std::string>("target") << "\n";
            std::cout << "verbose=" << (args.flag("verbose") ? "true" : "false") << "\n";
            std::cout << "create_dir=" << args.get<std::string>("create_dir") << "\n";
            std::cout << "create_file=" << args.get<std::string>("create_file") << "\n";
            return 0;
        });
    return cmd.execute();
}
