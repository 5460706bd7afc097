#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "mocks/scene_mocks.h"
#include "provider_registry.h"

TEST_CASE("Provider discovery by known shape name", "[registry]") {
    MockTypeCatalog catalog{&ShapeOf<UnrelatedData>(), &ShapeOf<ScopeCameraData>()};
    ProviderRegistry registry(catalog);

    REQUIRE_FALSE(registry.HasSearched());
    const ProviderBinding* binding = registry.Resolve();
    REQUIRE(binding != nullptr);
    REQUIRE(binding->type == &ShapeOf<ScopeCameraData>());
    REQUIRE(registry.Method() == DiscoveryMethod::KnownName);
    REQUIRE(catalog.scanCalls == 0);

    SECTION("All accessors resolved") {
        REQUIRE(binding->fov != nullptr);
        REQUIRE(binding->nearClip != nullptr);
        REQUIRE(binding->farClip != nullptr);
        REQUIRE(binding->cullingMask != nullptr);
        REQUIRE(binding->cullingScale != nullptr);
    }
}

TEST_CASE("Provider discovery falls back to a structural scan", "[registry]") {
    MockTypeCatalog catalog{&ShapeOf<UnrelatedData>(), &ShapeOf<SightFovOnly>(), &ShapeOf<VendorOpticData>()};
    ProviderRegistry registry(catalog);

    const ProviderBinding* binding = registry.Resolve();
    REQUIRE(binding != nullptr);
    REQUIRE(binding->type == &ShapeOf<VendorOpticData>());
    REQUIRE(registry.Method() == DiscoveryMethod::Scan);
    REQUIRE(binding->cullingMask == nullptr);
    REQUIRE(catalog.scanCalls == 1);
}

TEST_CASE("Provider discovery runs at most once", "[registry]") {
    SECTION("Nothing found") {
        MockTypeCatalog catalog{&ShapeOf<UnrelatedData>()};
        ProviderRegistry registry(catalog);

        for (int i = 0; i < 10; ++i) {
            REQUIRE(registry.Resolve() == nullptr);
        }
        REQUIRE(registry.HasSearched());
        REQUIRE(registry.Method() == DiscoveryMethod::None);
        REQUIRE(catalog.scanCalls == 1);

        // A type loaded later is never picked up
        catalog.types.push_back(&ShapeOf<ScopeCameraData>());
        REQUIRE(registry.Resolve() == nullptr);
        REQUIRE(catalog.scanCalls == 1);
    }

    SECTION("Found") {
        MockTypeCatalog catalog{&ShapeOf<VendorOpticData>()};
        ProviderRegistry registry(catalog);

        const ProviderBinding* first = registry.Resolve();
        const int findCalls = catalog.findCalls;
        for (int i = 0; i < 10; ++i) {
            REQUIRE(registry.Resolve() == first);
        }
        REQUIRE(catalog.scanCalls == 1);
        REQUIRE(catalog.findCalls == findCalls);
    }
}

TEST_CASE("Provider discovery isolates catalog failures", "[registry]") {
    SECTION("Throwing name lookup moves on to the next name") {
        MockTypeCatalog catalog{&ShapeOf<ScopeCameraData>()};
        catalog.throwingNames.insert("EFT.CameraControl.ScopeCameraData");

        ProviderRegistry registry(catalog);
        const ProviderBinding* binding = registry.Resolve();
        REQUIRE(binding != nullptr);
        REQUIRE(registry.Method() == DiscoveryMethod::KnownName);
    }

    SECTION("Throwing scan yields no binding and is not retried") {
        MockTypeCatalog catalog{&ShapeOf<VendorOpticData>()};
        catalog.scanThrows = true;

        ProviderRegistry registry(catalog);
        REQUIRE(registry.Resolve() == nullptr);
        catalog.scanThrows = false;
        REQUIRE(registry.Resolve() == nullptr);
        REQUIRE(catalog.scanCalls == 1);
    }
}

TEST_CASE("Provider adoption from the structural FOV search", "[registry]") {
    MockTypeCatalog catalog{&ShapeOf<UnrelatedData>()};
    ProviderRegistry registry(catalog);

    auto fovOnly = ProviderBinding::FromType(ShapeOf<SightFovOnly>());
    REQUIRE(fovOnly.has_value());

    SECTION("Accepted while nothing is bound") {
        REQUIRE(registry.Resolve() == nullptr);
        REQUIRE(registry.Adopt(*fovOnly));
        REQUIRE(registry.Method() == DiscoveryMethod::Adopted);
        REQUIRE(registry.Resolve()->type == &ShapeOf<SightFovOnly>());
        REQUIRE(catalog.scanCalls == 1);
    }

    SECTION("Rejected once a shape is bound") {
        MockTypeCatalog named{&ShapeOf<ScopeCameraData>()};
        ProviderRegistry bound(named);
        REQUIRE(bound.Resolve() != nullptr);
        REQUIRE_FALSE(bound.Adopt(*fovOnly));
        REQUIRE(bound.Resolve()->type == &ShapeOf<ScopeCameraData>());
    }

    SECTION("Adoption does not trigger discovery later") {
        REQUIRE(registry.Adopt(*fovOnly));
        REQUIRE(registry.Resolve()->type == &ShapeOf<SightFovOnly>());
        REQUIRE(catalog.scanCalls == 0);
    }
}

TEST_CASE("Provider binding rejects shapes without a float FOV", "[registry]") {
    REQUIRE_FALSE(ProviderBinding::FromType(ShapeOf<UnrelatedData>()).has_value());
}

TEST_CASE("Provider binding reads field values", "[registry]") {
    MockSceneNode node("optic");
    ScopeCameraData data;
    data.FieldOfView = 4.0f;
    data.NearClipPlane = 0.03f;
    data.FarClipPlane = 2500.0f;
    data.OpticCullingMask = 0x1F;
    data.OpticCullingMaskScale = 0.5f;
    auto& component = node.Attach(data);
    auto& vendor = node.Attach(VendorOpticData{3.0f, 0.05f, 1200.0});

    auto binding = ProviderBinding::FromType(ShapeOf<ScopeCameraData>());
    REQUIRE(binding.has_value());

    REQUIRE(*binding->ReadFov(component) == Catch::Approx(4.0f));
    REQUIRE(*binding->ReadNearClip(component) == Catch::Approx(0.03f));
    REQUIRE(*binding->ReadFarClip(component) == Catch::Approx(2500.0f));
    REQUIRE(*binding->ReadCullingMask(component) == 0x1F);
    REQUIRE(*binding->ReadCullingScale(component) == Catch::Approx(0.5f));

    SECTION("Other shapes are not read") {
        auto fov = binding->ReadFov(vendor);
        REQUIRE_FALSE(fov.has_value());
        REQUIRE(fov.error() == LookupError::FieldMissing);
    }

    SECTION("Double far clip is read as float") {
        auto vendorBinding = ProviderBinding::FromType(ShapeOf<VendorOpticData>());
        REQUIRE(*vendorBinding->ReadFarClip(vendor) == Catch::Approx(1200.0f));
        REQUIRE(vendorBinding->ReadCullingMask(vendor).error() == LookupError::FieldMissing);
    }
}

TEST_CASE("Reflected type catalog serves registered shapes", "[registry]") {
    InitTestShapes();
    ReflectedTypeCatalog catalog;

    REQUIRE(catalog.FindByName("ScopeCameraData") == &ShapeOf<ScopeCameraData>());
    REQUIRE(catalog.FindByName("NoSuchShape") == nullptr);

    bool sawVendor = false;
    catalog.ForEachType([&](const cpp26::reflect::TypeInfo& type) {
        sawVendor = &type == &ShapeOf<VendorOpticData>();
        return !sawVendor;
    });
    REQUIRE(sawVendor);

    ProviderRegistry registry(catalog);
    REQUIRE(registry.Resolve()->type == &ShapeOf<ScopeCameraData>());
    REQUIRE(registry.Method() == DiscoveryMethod::KnownName);
}
