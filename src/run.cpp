#include <SDL2/SDL.h>
#include <cstdio>
#include <stdexcept>
#include <utility>

#include "config.h"
#include "nes.h"

// Copies each finished frame into the streaming texture and shows it
class SDLFrameSink : public FrameSink {
public:
    SDLFrameSink(SDL_Renderer* renderer, SDL_Texture* texture) : renderer(renderer), texture(texture) {}

    void present(const uint32_t* pixels) override {
        SDL_UpdateTexture(texture, nullptr, pixels, SCREEN_WIDTH * sizeof(uint32_t));
        SDL_RenderClear(renderer);
        SDL_RenderCopy(renderer, texture, nullptr, nullptr);
        SDL_RenderPresent(renderer);
    }

private:
    SDL_Renderer* renderer;
    SDL_Texture* texture;
};

// Z = A, X = B, A = Select, S = Start, arrows = D-pad
static void update_controller(Input& input, const Uint8* keys) {
    input.set_buttons(0,
                      keys[SDL_SCANCODE_Z],
                      keys[SDL_SCANCODE_X],
                      keys[SDL_SCANCODE_A],
                      keys[SDL_SCANCODE_S],
                      keys[SDL_SCANCODE_UP],
                      keys[SDL_SCANCODE_DOWN],
                      keys[SDL_SCANCODE_LEFT],
                      keys[SDL_SCANCODE_RIGHT]);
}

static void report_halt(NES& nes) {
    fprintf(stderr, "CPU halted on opcode 0x%02X at 0x%04X\n",
            nes.get_cpu().getCurrentOpcode(), nes.get_cpu().get_bad_address());
}

// FNV-1a over the frame, so headless runs can be compared
static uint32_t frame_checksum(const uint32_t* pixels) {
    uint32_t hash = 2166136261u;
    for (int i = 0; i < SCREEN_WIDTH * SCREEN_HEIGHT; i++) {
        for (int shift = 0; shift < 32; shift += 8) {
            hash ^= (pixels[i] >> shift) & 0xFF;
            hash *= 16777619u;
        }
    }
    return hash;
}

static int run_headless(NES& nes, int frames) {
    for (int i = 0; i < frames; i++) {
        if (!nes.run_frame()) {
            report_halt(nes);
            return 1;
        }
    }
    printf("frame %llu checksum %08X\n", (unsigned long long)nes.frame_count(), frame_checksum(nes.frame_buffer()));
    return 0;
}

static int run_window(NES& nes, int scale) {
    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        fprintf(stderr, "SDL_Init Error: %s\n", SDL_GetError());
        return 1;
    }

    SDL_Window* window = SDL_CreateWindow(
        "zetr",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        SCREEN_WIDTH * scale, SCREEN_HEIGHT * scale,
        SDL_WINDOW_SHOWN
    );
    if (!window) {
        fprintf(stderr, "SDL_CreateWindow Error: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
    if (!renderer) {
        fprintf(stderr, "SDL_CreateRenderer Error: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }
    SDL_Texture* texture = SDL_CreateTexture(renderer, SDL_PIXELFORMAT_ARGB8888, SDL_TEXTUREACCESS_STREAMING,
                                             SCREEN_WIDTH, SCREEN_HEIGHT);
    if (!texture) {
        fprintf(stderr, "SDL_CreateTexture Error: %s\n", SDL_GetError());
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }
    SDLFrameSink sink(renderer, texture);

    printf("Controls: arrows, Z = A, X = B, A = Select, S = Start, Esc = quit\n");

    const Uint32 FRAME_MS = 1000 / 60;
    int status = 0;
    bool running = true;
    SDL_Event e;

    // MAIN LOOP
    while (running) {
        Uint32 frame_start = SDL_GetTicks();

        while (SDL_PollEvent(&e)) {
            if (e.type == SDL_QUIT) running = false;
            if (e.type == SDL_KEYDOWN && e.key.keysym.sym == SDLK_ESCAPE) running = false;
        }

        update_controller(nes.get_input(), SDL_GetKeyboardState(NULL));

        if (!nes.run_frame(&sink)) {
            report_halt(nes);
            status = 1;
            break;
        }

        // ~60 Hz
        Uint32 elapsed = SDL_GetTicks() - frame_start;
        if (elapsed < FRAME_MS) {
            SDL_Delay(FRAME_MS - elapsed);
        }
    }

    // Clean up
    SDL_DestroyTexture(texture);
    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();

    return status;
}

int main(int argc, char** argv) {
    Config config;
    try {
        config = parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        fprintf(stderr, "%s\n", e.what());
        print_usage(argv[0]);
        return 2;
    }
    if (config.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    std::unique_ptr<Cartridge> cartridge;
    try {
        cartridge = load_ines(config.rom_path);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "Failed to load %s: %s\n", config.rom_path.c_str(), e.what());
        return 1;
    }

    printf("Loaded %s: mapper %d, %zu KB PRG, %zu KB %s, %s mirroring\n",
           config.rom_path.c_str(),
           cartridge->get_mapper_id(),
           cartridge->get_prg_size() / 1024,
           cartridge->has_chr_ram() ? (size_t)8 : cartridge->get_chr_size() / 1024,
           cartridge->has_chr_ram() ? "CHR RAM" : "CHR ROM",
           cartridge->get_mirroring() == Mirroring::Vertical ? "vertical" : "horizontal");

    NES nes(std::move(cartridge));
    nes.get_ppu().set_odd_frame_skip(config.odd_frame_skip);

    FILE* trace = nullptr;
    if (config.trace_path == "-") {
        trace = stdout;
    } else if (!config.trace_path.empty()) {
        trace = fopen(config.trace_path.c_str(), "w");
        if (!trace) {
            fprintf(stderr, "Can't open trace file %s\n", config.trace_path.c_str());
            return 1;
        }
    }
    nes.get_cpu().set_trace(trace);

    int status = config.headless_frames > 0
        ? run_headless(nes, config.headless_frames)
        : run_window(nes, config.scale);

    if (trace && trace != stdout) {
        fclose(trace);
    }
    return status;
}
