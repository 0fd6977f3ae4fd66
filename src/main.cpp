#include "GreetingApp.hpp"

#include <iostream>

int main(int argc, char* argv[])
{
    try
    {
        greeting::GreetingApp app;

        std::cout << "========================================" << std::endl;
        std::cout << "  Greeting Service Starting" << std::endl;
        std::cout << "  Press Ctrl+C to stop" << std::endl;
        std::cout << "========================================" << std::endl;

        // SIGINT/SIGTERM останавливают сервер внутри run()
        app.run(argc, argv);

        std::cout << "[main] Greeting Service stopped" << std::endl;
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
