#include "snake_dep.h"  // IWYU pragma: keep
#include "snake_app.h"
#include "snake_draw.h"
#include "snake_theme.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

// ===== PLATFORM COLLABORATORS =====

namespace {

class SdlInputSource : public InputSource {
public:
    std::vector<InputEvent> drainEvents() override {
        std::vector<InputEvent> events;
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            switch (event.type) {
                case SDL_QUIT:
                    events.push_back(InputEvent::quit());
                    break;
                case SDL_KEYDOWN:
                    translateKey(event.key.keysym.sym, events);
                    break;
                default:
                    break;
            }
        }
        return events;
    }

private:
    // Unmapped keys are dropped
    static void translateKey(SDL_Keycode key, std::vector<InputEvent>& events) {
        switch (key) {
            case SDLK_UP:
            case SDLK_w:
                events.push_back(InputEvent::turn(Direction::UP));
                break;
            case SDLK_DOWN:
            case SDLK_s:
                events.push_back(InputEvent::turn(Direction::DOWN));
                break;
            case SDLK_LEFT:
            case SDLK_a:
                events.push_back(InputEvent::turn(Direction::LEFT));
                break;
            case SDLK_RIGHT:
            case SDLK_d:
                events.push_back(InputEvent::turn(Direction::RIGHT));
                break;
            case SDLK_ESCAPE:
                events.push_back(InputEvent::quit());
                break;
            default:
                break;
        }
    }
};

class GlRenderSink : public RenderSink {
public:
    GlRenderSink(SDL_Window* window, GLuint program, GLuint vao, const SnakeDraw::DrawContext& ctx)
        : m_window(window), m_program(program), m_vao(vao), m_ctx(ctx) {}

    void draw(const std::vector<const Drawable*>& drawables) override {
        SnakeDraw::clearBoard(SnakeTheme::GameColors::BOARD_BACKGROUND);

        glUseProgram(m_program);
        glBindVertexArray(m_vao);

        for (const Drawable* drawable : drawables) {
            SnakeDraw::drawCells(*drawable, m_ctx);
        }

        SDL_GL_SwapWindow(m_window);
    }

private:
    SDL_Window* m_window;
    GLuint m_program;
    GLuint m_vao;
    SnakeDraw::DrawContext m_ctx;
};

// Fixed-rate frame clock: sleeps away whatever is left of the tick
class SdlTickPacer : public TickPacer {
public:
    explicit SdlTickPacer(int ticksPerSecond)
        : m_tickMs(1000u / static_cast<Uint32>(ticksPerSecond)), m_lastTick(SDL_GetTicks()) {}

    void waitForNextTick() override {
        Uint32 elapsed = SDL_GetTicks() - m_lastTick;
        if (elapsed < m_tickMs) {
            SDL_Delay(m_tickMs - elapsed);
        }
        m_lastTick = SDL_GetTicks();
    }

private:
    Uint32 m_tickMs;
    Uint32 m_lastTick;
};

} // anonymous namespace

// ===== SNAKE APP PIMPL IMPLEMENTATION =====

class SnakeApp::Impl {
public:
    AppConfig config;

    // SDL/OpenGL resources
    SDL_Window* window = nullptr;
    SDL_GLContext glContext = nullptr;
    bool sdlInitialized = false;

    // OpenGL resources
    GLuint shaderProgram = 0;
    GLuint VAO = 0;
    GLuint VBO = 0;
    GLuint EBO = 0;

    // Uniform locations
    GLint u_offset = -1;
    GLint u_color = -1;
    GLint u_scale = -1;

    std::unique_ptr<SdlInputSource> inputSource;
    std::unique_ptr<GlRenderSink> renderSink;
    std::unique_ptr<SdlTickPacer> tickPacer;

    bool running = false;

    // ===== LOW-LEVEL IMPLEMENTATION METHODS =====

    bool initializeSDL() {
        if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) < 0) {
            std::cerr << "Failed to initialize SDL2: " << SDL_GetError() << std::endl;
            return false;
        }
        sdlInitialized = true;

        SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
        SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

        if (config.fullscreen) {
            SDL_DisplayMode displayMode;
            if (SDL_GetDesktopDisplayMode(0, &displayMode) != 0) {
                std::cerr << "Failed to get display mode: " << SDL_GetError() << std::endl;
                return false;
            }
            window = SDL_CreateWindow(config.windowTitle,
                SDL_WINDOWPOS_UNDEFINED, SDL_WINDOWPOS_UNDEFINED,
                displayMode.w, displayMode.h, SDL_WINDOW_OPENGL | SDL_WINDOW_FULLSCREEN);
        } else {
            window = SDL_CreateWindow(config.windowTitle,
                SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                config.windowWidth, config.windowHeight, SDL_WINDOW_OPENGL);
        }

        if (!window) {
            std::cerr << "Failed to create window: " << SDL_GetError() << std::endl;
            return false;
        }

        glContext = SDL_GL_CreateContext(window);
        if (!glContext) {
            std::cerr << "Failed to create OpenGL context: " << SDL_GetError() << std::endl;
            return false;
        }

        // Pacing is ours, not the display's
        SDL_GL_SetSwapInterval(0);
        return true;
    }

    bool initializeOpenGL() {
        if (!gladLoadGL((GLADloadfunc)SDL_GL_GetProcAddress)) {
            std::cerr << "Failed to initialize GLAD" << std::endl;
            return false;
        }

        int drawableWidth = 0;
        int drawableHeight = 0;
        SDL_GL_GetDrawableSize(window, &drawableWidth, &drawableHeight);
        glViewport(0, 0, drawableWidth, drawableHeight);
        return true;
    }

    bool loadShaders() {
        std::string vertexPath = config.shaderDir + "/vertex.vs";
        std::string fragmentPath = config.shaderDir + "/fragment.fs";
        std::string vertexShaderSource = loadShaderFromFile(vertexPath);
        std::string fragmentShaderSource = loadShaderFromFile(fragmentPath);

        if (vertexShaderSource.empty() || fragmentShaderSource.empty()) {
            std::cerr << "Failed to load shader files from " << config.shaderDir << "/" << std::endl;
            return false;
        }

        GLuint vertexShader = compileShader(vertexShaderSource, GL_VERTEX_SHADER, "Vertex");
        GLuint fragmentShader = compileShader(fragmentShaderSource, GL_FRAGMENT_SHADER, "Fragment");

        if (vertexShader == 0 || fragmentShader == 0) {
            if (vertexShader != 0) glDeleteShader(vertexShader);
            if (fragmentShader != 0) glDeleteShader(fragmentShader);
            return false;
        }

        shaderProgram = glCreateProgram();
        glAttachShader(shaderProgram, vertexShader);
        glAttachShader(shaderProgram, fragmentShader);
        glLinkProgram(shaderProgram);

        glDeleteShader(vertexShader);
        glDeleteShader(fragmentShader);

        GLint linked;
        glGetProgramiv(shaderProgram, GL_LINK_STATUS, &linked);
        if (!linked) {
            GLchar infoLog[512];
            glGetProgramInfoLog(shaderProgram, 512, NULL, infoLog);
            std::cerr << "Shader program link failed: " << infoLog << std::endl;
            return false;
        }

        // Get uniforms
        u_offset = glGetUniformLocation(shaderProgram, "u_offset");
        u_color = glGetUniformLocation(shaderProgram, "u_color");
        u_scale = glGetUniformLocation(shaderProgram, "u_scale");

        return true;
    }

    bool setupRenderResources() {
        // Unit square, scaled and offset per cell by the vertex shader
        float squareVertices[] = {
            0.0f, 0.0f,
            1.0f, 0.0f,
            1.0f, 1.0f,
            0.0f, 1.0f
        };

        GLuint indices[] = {0, 1, 2, 2, 3, 0};

        glGenVertexArrays(1, &VAO);
        glGenBuffers(1, &VBO);
        glGenBuffers(1, &EBO);

        glBindVertexArray(VAO);
        glBindBuffer(GL_ARRAY_BUFFER, VBO);
        glBufferData(GL_ARRAY_BUFFER, sizeof(squareVertices), squareVertices, GL_STATIC_DRAW);
        glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, EBO);
        glBufferData(GL_ELEMENT_ARRAY_BUFFER, sizeof(indices), indices, GL_STATIC_DRAW);

        glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, 2 * sizeof(float), (void*)0);
        glEnableVertexAttribArray(0);

        return true;
    }

    void createCollaborators() {
        SnakeDraw::DrawContext ctx(config.gridWidth(), config.gridHeight(), u_offset, u_color, u_scale);
        inputSource = std::make_unique<SdlInputSource>();
        renderSink = std::make_unique<GlRenderSink>(window, shaderProgram, VAO, ctx);
        tickPacer = std::make_unique<SdlTickPacer>(config.ticksPerSecond);
    }

    void cleanup() {
        tickPacer.reset();
        renderSink.reset();
        inputSource.reset();

        if (glContext) {
            if (EBO != 0) glDeleteBuffers(1, &EBO);
            if (VBO != 0) glDeleteBuffers(1, &VBO);
            if (VAO != 0) glDeleteVertexArrays(1, &VAO);
            if (shaderProgram != 0) glDeleteProgram(shaderProgram);
            EBO = VBO = VAO = shaderProgram = 0;

            SDL_GL_DeleteContext(glContext);
            glContext = nullptr;
        }
        if (window) {
            SDL_DestroyWindow(window);
            window = nullptr;
        }
        if (sdlInitialized) {
            SDL_Quit();
            sdlInitialized = false;
        }
    }

    // Utility functions
    std::string loadShaderFromFile(const std::string& filepath) {
        std::ifstream file(filepath);
        if (!file.is_open()) return "";

        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    GLuint compileShader(const std::string& source, GLenum shaderType, const char* shaderName) {
        GLuint shader = glCreateShader(shaderType);
        const char* sourcePtr = source.c_str();
        glShaderSource(shader, 1, &sourcePtr, NULL);
        glCompileShader(shader);

        GLint success;
        glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
        if (!success) {
            GLchar infoLog[512];
            glGetShaderInfoLog(shader, 512, NULL, infoLog);
            std::cerr << shaderName << " shader compilation failed: " << infoLog << std::endl;
            glDeleteShader(shader);
            return 0;
        }

        return shader;
    }
};

// ===== SNAKE APP PUBLIC INTERFACE =====

SnakeApp::SnakeApp() : m_impl(std::make_unique<Impl>()) {}

SnakeApp::~SnakeApp() {
    m_impl->cleanup();
}

bool SnakeApp::initialize(const AppConfig& config) {
    m_impl->config = config;

    if (!m_impl->initializeSDL() ||
        !m_impl->initializeOpenGL() ||
        !m_impl->loadShaders() ||
        !m_impl->setupRenderResources()) {
        m_impl->cleanup();
        return false;
    }

    m_impl->createCollaborators();
    m_impl->running = true;

    std::cout << "✅ Snake Application initialized successfully" << std::endl;
    return true;
}

void SnakeApp::shutdown() {
    if (!m_impl->running) return;

    m_impl->running = false;
    m_impl->cleanup();
    std::cout << "✅ Snake Application shut down" << std::endl;
}

InputSource& SnakeApp::input() { return *m_impl->inputSource; }
RenderSink& SnakeApp::renderer() { return *m_impl->renderSink; }
TickPacer& SnakeApp::pacer() { return *m_impl->tickPacer; }
