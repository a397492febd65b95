#include "ControlFlow.hpp"
#include "ConfigGlobal.hpp"

int main(int argc, char* argv[])
{
    ConfigGlobal::InitializeDefaults();
    if (argc > 1)
    {
        ConfigGlobal::ConfigFile = argv[1];
    }

    ControlFlow Flow;
    return Flow.Run();
}
