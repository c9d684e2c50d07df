#include <benchmark/benchmark.h>
#include <cmath>
#include <memory>
#include <vector>

#include <vellum/pointer.hpp>
#include <vellum/recording_surface.hpp>
#include <vellum/registry.hpp>

using namespace vellum;

// --- Helpers ---

static std::shared_ptr<const PrimitiveKind> square_kind()
{
    PrimitiveCapabilities caps;
    caps.name      = "square";
    caps.is_inside = [](const Primitive&, double x, double y)
    { return std::abs(x) < 5.0 && std::abs(y) < 5.0; };
    caps.events.over = [](Primitive& p) { p.set("highlighted", true); };
    caps.events.out  = [](Primitive& p) { p.set("highlighted", false); };
    return define_primitive(
        [](Primitive&, Surface& s)
        {
            s.begin_path();
            s.rect(-5.0, -5.0, 10.0, 10.0);
            s.fill();
        },
        caps);
}

static void fill_grid(Registry& registry, std::size_t n, std::shared_ptr<Surface> surface = {})
{
    auto kind = square_kind();
    for (std::size_t i = 0; i < n; ++i)
    {
        double x = static_cast<double>(i % 100) * 8.0;
        double y = static_cast<double>(i / 100) * 8.0;
        registry.add(kind->create({{"x", x}, {"y", y}}, {}, surface));
    }
}

// --- Hit testing ---

static void BM_ObjectsUnder(benchmark::State& state)
{
    const auto n = static_cast<std::size_t>(state.range(0));
    Registry   registry;
    fill_grid(registry, n);
    for (auto _ : state)
    {
        auto hits = registry.objects_under(404.0, 40.0);
        benchmark::DoNotOptimize(hits);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}
BENCHMARK(BM_ObjectsUnder)->Arg(1'000)->Arg(10'000)->Arg(100'000);

static void BM_PointerSweep(benchmark::State& state)
{
    const auto        n = static_cast<std::size_t>(state.range(0));
    Registry          registry;
    PointerDispatcher dispatcher(registry);
    fill_grid(registry, n);
    double x = 0.0;
    for (auto _ : state)
    {
        x = std::fmod(x + 3.0, 800.0);
        dispatcher.move(x, 40.0);
        dispatcher.update();
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}
BENCHMARK(BM_PointerSweep)->Arg(1'000)->Arg(10'000);

// --- Frame work ---

static void BM_UpdateAnimating(benchmark::State& state)
{
    const auto n = static_cast<std::size_t>(state.range(0));
    Registry   registry;
    fill_grid(registry, n);
    for (auto _ : state)
    {
        state.PauseTiming();
        for (const auto& p : registry.primitives())
            p->animate({{"alpha", 0.0}}, 60);
        state.ResumeTiming();

        registry.update();
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}
BENCHMARK(BM_UpdateAnimating)->Arg(1'000)->Arg(10'000);

static void BM_RenderRecording(benchmark::State& state)
{
    const auto n       = static_cast<std::size_t>(state.range(0));
    auto       surface = std::make_shared<RecordingSurface>(800, 800);
    Registry   registry;
    fill_grid(registry, n, surface);
    for (auto _ : state)
    {
        surface->reset();
        registry.render();
        benchmark::DoNotOptimize(surface->commands().data());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}
BENCHMARK(BM_RenderRecording)->Arg(1'000)->Arg(10'000);
