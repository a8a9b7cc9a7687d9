#include <iostream>
#include <string>

#include "bubble/cli_options.hpp"
#include "bubble/viewer/viewer_app.hpp"

int main(int argc, char** argv) {
    bubble::ViewerCliOptions options;
    std::string error;
    if (!bubble::ParseViewerCliArgs(argc, argv, &options, &error)) {
        if (options.helpRequested) {
            bubble::PrintViewerUsage(std::cout, argv[0]);
            return 0;
        }
        std::cerr << error << "\n";
        bubble::PrintViewerUsage(std::cerr, argv[0]);
        return 1;
    }

    bubble::viewer::ViewerApp app(options);
    return app.Run();
}
