#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "config_manager.h"
#include "mocks/scene_mocks.h"
#include "scroll_zoom.h"

namespace {

// Variable 1.4x - 7x optic: native full-angle range 5 - 25
struct VariableOptic {
    MockSceneNode scopeRoot{"scope_razor"};
    MockSceneNode& optic = scopeRoot.AddChild("mode_000");
    MockZoomHandler& handler = scopeRoot.AttachZoomHandler(12.5f, FovRange{12.5f, 2.5f});
};

void ScrollMany(ScrollZoom& zoom, float delta, const ZoomConfig& config, int count = 50) {
    for (int i = 0; i < count; ++i) zoom.HandleScroll(delta, config);
}

} // anonymous namespace

TEST_CASE("Scroll zoom range discovery", "[scroll]") {
    VariableOptic v;
    ScrollZoom zoom;
    zoom.ObserveNativeFov(25.0f);

    SECTION("Variable optic") {
        zoom.DiscoverRange(v.optic);
        REQUIRE(zoom.RangeDiscovered());
        REQUIRE(zoom.IsVariableZoom());
        REQUIRE(zoom.NativeMinFov() == Catch::Approx(5.0f));
        REQUIRE(zoom.NativeMaxFov() == Catch::Approx(25.0f));
    }

    SECTION("Discovery runs once per optic session") {
        zoom.DiscoverRange(v.optic);
        v.handler.range = FovRange{20.0f, 1.0f};
        zoom.DiscoverRange(v.optic);
        REQUIRE(zoom.NativeMinFov() == Catch::Approx(5.0f));

        zoom.Reset();
        REQUIRE_FALSE(zoom.RangeDiscovered());
        zoom.DiscoverRange(v.optic);
        REQUIRE(zoom.NativeMinFov() == Catch::Approx(2.0f));
    }

    SECTION("Missing or degenerate range is a fixed optic") {
        v.handler.range.reset();
        zoom.DiscoverRange(v.optic);
        REQUIRE(zoom.RangeDiscovered());
        REQUIRE_FALSE(zoom.IsVariableZoom());

        zoom.Reset();
        v.handler.range = FovRange{4.0f, 4.0f};
        zoom.DiscoverRange(v.optic);
        REQUIRE_FALSE(zoom.IsVariableZoom());
    }

    SECTION("Throwing handler is a fixed optic") {
        v.handler.throws = true;
        zoom.DiscoverRange(v.optic);
        REQUIRE(zoom.RangeDiscovered());
        REQUIRE_FALSE(zoom.IsVariableZoom());
    }
}

TEST_CASE("Scroll zoom steps and clamps", "[scroll]") {
    VariableOptic v;
    ZoomConfig config;
    ScrollZoom zoom;
    zoom.ObserveNativeFov(25.0f);

    SECTION("Fixed optic ignores scroll") {
        REQUIRE_FALSE(zoom.HandleScroll(1.0f, config));
        REQUIRE(zoom.EffectiveScopeFov() == 0.0f);
    }

    zoom.DiscoverRange(v.optic);

    SECTION("First step starts from the native FOV") {
        REQUIRE(zoom.HandleScroll(1.0f, config));
        REQUIRE(zoom.IsActive());
        REQUIRE(zoom.EffectiveScopeFov() == Catch::Approx(25.0f / 1.15f));

        REQUIRE(zoom.HandleScroll(-1.0f, config));
        REQUIRE(zoom.EffectiveScopeFov() == Catch::Approx(24.9f));
    }

    SECTION("Clamped inside the native range") {
        ScrollMany(zoom, 1.0f, config);
        REQUIRE(zoom.EffectiveScopeFov() == Catch::Approx(5.1f));
        ScrollMany(zoom, -1.0f, config);
        REQUIRE(zoom.EffectiveScopeFov() == Catch::Approx(24.9f));
    }

    SECTION("Magnification limits from config") {
        config.scrollZoomMax = 5.0f;
        config.scrollZoomMin = 2.0f;
        ScrollMany(zoom, 1.0f, config);
        REQUIRE(zoom.EffectiveScopeFov() == Catch::Approx(7.0f));
        ScrollMany(zoom, -1.0f, config);
        REQUIRE(zoom.EffectiveScopeFov() == Catch::Approx(17.5f));
    }

    SECTION("Unusable config limits fall back to the native range") {
        config.scrollZoomMax = 3.0f;
        config.scrollZoomMin = 3.0f;
        ScrollMany(zoom, 1.0f, config);
        REQUIRE(zoom.EffectiveScopeFov() == Catch::Approx(5.1f));
    }

    SECTION("Tiny deltas and disabled scroll are ignored") {
        REQUIRE_FALSE(zoom.HandleScroll(0.005f, config));
        config.enableScrollZoom = false;
        REQUIRE_FALSE(zoom.HandleScroll(1.0f, config));
        REQUIRE_FALSE(zoom.IsActive());
    }
}

TEST_CASE("Scroll zoom is cancelled by a native FOV change", "[scroll]") {
    VariableOptic v;
    ZoomConfig config;
    ScrollZoom zoom;
    zoom.ObserveNativeFov(25.0f);
    zoom.DiscoverRange(v.optic);
    zoom.HandleScroll(1.0f, config);
    REQUIRE(zoom.IsActive());

    SECTION("Small drift keeps the override") {
        zoom.ObserveNativeFov(25.02f);
        REQUIRE(zoom.IsActive());
    }

    SECTION("Mode switch drops the override") {
        zoom.ObserveNativeFov(10.0f);
        REQUIRE_FALSE(zoom.IsActive());
        REQUIRE(zoom.EffectiveScopeFov() == 0.0f);
        REQUIRE(zoom.NativeFov() == 10.0f);
    }

    SECTION("Unresolved readings are ignored") {
        zoom.ObserveNativeFov(0.0f);
        REQUIRE(zoom.IsActive());
        REQUIRE(zoom.NativeFov() == 25.0f);
    }
}
