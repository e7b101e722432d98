#include <iostream>
#include <optional>
#include <string>

#include "mcli/mcli.hpp"

// sum 1 2 3 --scale=10 --label=total --precision=2
int main(int argc, char** argv) {
    mcli::Command cmd("sum", "Adds numbers, extra --key=value options are echoed back");
    cmd.spec(mcli::ArgSpecBuilder()
                 .positionalOnly("first")
                 .variadicPositional("rest")
                 .namedOnly("scale", 1)
                 .variadicNamed("extra")
                 .build())
        .actionE([](const mcli::BoundArgs& args) -> std::optional<std::string> {
            double total = args.get<double>("first");
            for (const auto& v : args.variadic()) total += mcli::convertArgValue<double>(v);
            total *= args.get<double>("scale");
            std::cout << "total=" << total << "\n";

            for (const auto& [name, value] : args.named()) {
                if (name == "scale") continue;
                std::cout << name << "=" << mcli::toString(value) << "\n";
            }
            return std::nullopt;
        });
    return cmd.run(argc, argv);
}
