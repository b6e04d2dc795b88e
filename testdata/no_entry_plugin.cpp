// Test fixture: a shared library without any VST entry symbol.

extern "C" __attribute__((visibility("default"))) int kodamaNotAPlugin() {
    return 42;
}
