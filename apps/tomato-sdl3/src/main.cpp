#include <app/app.hpp>

#include <SDL3/SDL_main.h>

int main(int argc, char **argv) {
    app::App app{};
    return app.Run();
}
