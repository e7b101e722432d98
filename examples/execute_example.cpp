#include <iostream>
#include <string>

#include "mcli/mcli.hpp"

int main() {
    mcli::Command cmd("greet", "Execute example");
    cmd.spec(mcli::ArgSpecBuilder().ambiguous("name").namedOnly("times", 1).build());
    cmd.action([](const mcli::BoundArgs& args) {
        for (int i = 0; i < args.get<int>("times"); ++i) {
            std::cout << "hello, " << args.get<std::string>("name") << "\n";
        }
        return 0;
    });

    cmd.setArgs({"world", "--times=2", "--debug"});
    return cmd.execute();
}
