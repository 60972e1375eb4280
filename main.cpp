#include "app/BlogForgeApp.hpp"

int main(int, char**) {
    blogforge::app::BlogForgeApp app;
    return app.Run();
}
