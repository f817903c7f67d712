#pragma once

#include <memory>

namespace filetree {

class App {
public:
    App();
    ~App();
    int run(int argc, char** argv);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace filetree
