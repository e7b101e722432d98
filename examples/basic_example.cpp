#include <iostream>
#include <string>

#include "mcli/mcli.hpp"

static const char* kHelp = R"(Usage: copy IN_FILE OUT_FILE [--create-new]

Read the contents of an input file and describe how it would be written to another file.

Args:
    in_file: Name of the source file.
    out_file: Name of the destination file.
    create_new: If this argument is present, create a new file.
)";

int main(int argc, char** argv) {
    mcli::Command cmd("copy", "Copy one file to another", kHelp);
    cmd.spec(mcli::ArgSpecBuilder()
                 .positionalOnly("in_file")
                 .positionalOnly("out_file")
                 .namedOnly("create_new", false)
                 .build())
        .action([](const mcli::BoundArgs& args) {
            std::cout << "in_file=" << args.get<std::string>("in_file") << "\n";
            std::cout << "out_file=" << args.get<std::string>("out_file") << "\n";
            std::cout << "create_new=" << (args.flag("create_new") ? "true" : "false") << "\n";
            return 0;
        });
    return cmd.run(argc, argv);
}
