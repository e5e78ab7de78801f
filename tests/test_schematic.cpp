#include <gtest/gtest.h>
#include "litevox/error.hpp"
#include "litevox/log.hpp"
#include "litevox/nbt_io.hpp"
#include "litevox/schematic.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace litevox;

namespace {

NbtList makeTileEntities() {
    NbtCompound chest;
    chest.insert("id", "minecraft:chest");
    chest.insert("x", int32_t{1});
    chest.insert("y", int32_t{0});
    chest.insert("z", int32_t{0});
    chest.insert("Items", NbtList());
    NbtList list;
    list.push(std::move(chest));
    return list;
}

Schematic makeHouse() {
    Schematic schematic("house");
    schematic.setAuthor("builder");
    schematic.setDescription("a small house");
    schematic.setTimeCreated(1700000000000);
    schematic.setTimeModified(1700000050000);
    schematic.setDataVersion(3465);

    Region walls;
    walls.setBlock(BlockPos(0, 0, 0), BlockState("stone"));
    walls.setBlock(BlockPos(2, 1, 0), BlockState("stone_bricks"));
    walls.setBlock(BlockPos(2, 2, 0), BlockState("stone_bricks"));
    walls.setBlock(BlockPos(5, 2, 1), BlockState("basalt"));
    walls.setBlock(BlockPos(1, 0, 0), BlockState("chest", {{"facing", "north"}, {"type", "single"}}));
    walls.setPayload(RegionPayload::TileEntities, makeTileEntities());
    schematic.addRegion("walls", std::move(walls));

    Region roof(Volume(BlockPos(0, 3, 0), BlockPos(6, 1, 2)));
    roof.setBlock(BlockPos(3, 3, 1), BlockState("oak_slab", {{"type", "top"}}));
    schematic.addRegion("roof", std::move(roof));

    return schematic;
}

void expectSameSchematic(const Schematic& a, const Schematic& b) {
    EXPECT_EQ(a.name(), b.name());
    EXPECT_EQ(a.author(), b.author());
    EXPECT_EQ(a.description(), b.description());
    EXPECT_EQ(a.timeCreated(), b.timeCreated());
    EXPECT_EQ(a.timeModified(), b.timeModified());
    EXPECT_EQ(a.dataVersion(), b.dataVersion());
    ASSERT_EQ(a.regionCount(), b.regionCount());
    for (const auto& [name, region] : a.regions()) {
        const Region* other = b.region(name);
        ASSERT_NE(other, nullptr) << name;
        EXPECT_EQ(region.blocks(), other->blocks()) << name;
        for (RegionPayload which : ALL_REGION_PAYLOADS) {
            const NbtList* mine = region.payload(which);
            const NbtList* theirs = other->payload(which);
            ASSERT_EQ(mine == nullptr, theirs == nullptr) << name << " " << regionPayloadName(which);
            if (mine) {
                EXPECT_EQ(*mine, *theirs) << name << " " << regionPayloadName(which);
            }
        }
    }
}

class SchematicTest : public ::testing::Test {
protected:
    void SetUp() override {
        setLogLevel(LogLevel::Error);
    }

    void TearDown() override {
        setLogLevel(LogLevel::Info);
    }
};

class SchematicFileTest : public SchematicTest {
protected:
    void SetUp() override {
        SchematicTest::SetUp();
        tempDir = std::filesystem::temp_directory_path() / "litevox_schematic_test";
        std::filesystem::create_directories(tempDir);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir);
        SchematicTest::TearDown();
    }

    std::filesystem::path tempDir;
};

}  // namespace

// ============================================================================
// Regions
// ============================================================================

TEST_F(SchematicTest, Construction) {
    Schematic schematic("empty");
    EXPECT_EQ(schematic.name(), "empty");
    EXPECT_EQ(schematic.regionCount(), 0u);
    EXPECT_EQ(schematic.totalBlocks(), 0u);
    EXPECT_TRUE(schematic.enclosingVolume().empty());
}

TEST_F(SchematicTest, AddReplaceRemoveRegion) {
    Schematic schematic;
    Region& added = schematic.addRegion("main", Region());
    added.setBlock(BlockPos(0, 0, 0), BlockState("stone"));
    ASSERT_NE(schematic.region("main"), nullptr);
    EXPECT_EQ(schematic.region("main")->totalBlocks(), 1u);

    // Same name replaces
    schematic.addRegion("main", Region());
    EXPECT_EQ(schematic.regionCount(), 1u);
    EXPECT_EQ(schematic.region("main")->totalBlocks(), 0u);

    EXPECT_TRUE(schematic.removeRegion("main"));
    EXPECT_FALSE(schematic.removeRegion("main"));
    EXPECT_EQ(schematic.region("main"), nullptr);
}

TEST_F(SchematicTest, TotalsAcrossRegions) {
    Schematic schematic;
    Region a;
    a.setBlock(BlockPos(0, 0, 0), BlockState("stone"));
    a.setBlock(BlockPos(1, 1, 1), BlockState("stone"));
    Region b;
    b.setBlock(BlockPos(4, 0, 0), BlockState("dirt"));
    schematic.addRegion("a", std::move(a));
    schematic.addRegion("b", std::move(b));

    EXPECT_EQ(schematic.totalBlocks(), 3u);
    EXPECT_EQ(schematic.enclosingVolume(), Volume(BlockPos(0, 0, 0), BlockPos(5, 2, 2)));
}

TEST_F(SchematicTest, EmptyRegionDoesNotStretchEnclosingVolume) {
    Schematic schematic;
    schematic.addRegion("a_empty", Region());
    Region b;
    b.setBlock(BlockPos(10, 10, 10), BlockState("stone"));
    schematic.addRegion("b", std::move(b));

    EXPECT_EQ(schematic.enclosingVolume(), Volume(BlockPos(10, 10, 10), BlockPos(1, 1, 1)));

    NbtCompound root = schematic.toNbt();
    const NbtCompound& metadata = root.getCompound("Metadata");
    EXPECT_EQ(blockPosFromNbt(metadata, "EnclosingSize"), BlockPos(1, 1, 1));
    EXPECT_EQ(metadata.getInt("TotalVolume"), 1);
    EXPECT_EQ(metadata.getInt("RegionCount"), 2);

    // The empty region is still written
    EXPECT_TRUE(root.getCompound("Regions").contains("a_empty"));
}

TEST_F(SchematicTest, OnlyEmptyRegions) {
    Schematic schematic;
    schematic.addRegion("a", Region());
    schematic.addRegion("b", Region(Volume(BlockPos(5, 5, 5), BlockPos(0, 3, 3))));
    EXPECT_TRUE(schematic.enclosingVolume().empty());

    const NbtCompound& metadata = schematic.toNbt().getCompound("Metadata");
    EXPECT_EQ(metadata.getInt("TotalVolume"), 0);
}

TEST_F(SchematicTest, CloneIsDeep) {
    Schematic original = makeHouse();
    Schematic copy = original.clone();
    expectSameSchematic(original, copy);

    copy.region("walls")->setBlock(BlockPos(0, 0, 0), BlockState::air());
    copy.setName("shed");
    EXPECT_EQ(original.region("walls")->totalBlocks(), 5u);
    EXPECT_EQ(original.name(), "house");
}

// ============================================================================
// Document conversion
// ============================================================================

TEST_F(SchematicTest, DerivedMetadata) {
    Schematic schematic("derived");
    Region a;
    a.setBlock(BlockPos(0, 0, 0), BlockState("stone"));
    a.setBlock(BlockPos(1, 1, 1), BlockState("stone"));
    Region b;
    b.setBlock(BlockPos(4, 0, 0), BlockState("dirt"));
    schematic.addRegion("a", std::move(a));
    schematic.addRegion("b", std::move(b));

    NbtCompound root = schematic.toNbt();
    EXPECT_EQ(root.getInt("Version"), LITEMATIC_VERSION);

    const NbtCompound& metadata = root.getCompound("Metadata");
    EXPECT_EQ(metadata.getString("Name"), "derived");
    EXPECT_EQ(metadata.getInt("RegionCount"), 2);
    EXPECT_EQ(metadata.getInt("TotalBlocks"), 3);
    EXPECT_EQ(metadata.getInt("TotalVolume"), 20);
    EXPECT_EQ(blockPosFromNbt(metadata, "EnclosingSize"), BlockPos(5, 2, 2));
}

TEST_F(SchematicTest, NbtRoundTrip) {
    Schematic original = makeHouse();
    Schematic decoded = Schematic::fromNbt(original.toNbt());
    expectSameSchematic(original, decoded);

    // Roof declared a larger volume than its one block
    const Region* roof = decoded.region("roof");
    ASSERT_NE(roof, nullptr);
    EXPECT_EQ(roof->volume(), Volume(BlockPos(0, 3, 0), BlockPos(6, 1, 2)));
}

TEST_F(SchematicTest, BufferRoundTripEveryEnvelope) {
    Schematic original = makeHouse();
    for (Compression c : {Compression::None, Compression::Gzip, Compression::Zlib, Compression::Lz4}) {
        std::vector<uint8_t> bytes = original.toBuffer(c);
        Schematic decoded = Schematic::fromBuffer(bytes);
        expectSameSchematic(original, decoded);
    }
}

TEST_F(SchematicTest, UnsupportedVersion) {
    NbtCompound root = makeHouse().toNbt();
    root.insert("Version", int32_t{4});
    try {
        (void)Schematic::fromNbt(root);
        FAIL() << "Expected UnsupportedVersionError";
    } catch (const UnsupportedVersionError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnsupportedVersion);
        EXPECT_EQ(e.version(), 4);
    }
}

TEST_F(SchematicTest, MissingMetadata) {
    NbtCompound root = makeHouse().toNbt();
    ASSERT_TRUE(root.remove("Metadata"));
    try {
        (void)Schematic::fromNbt(root);
        FAIL() << "Expected SchematicError";
    } catch (const SchematicError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MissingField);
        EXPECT_EQ(e.field(), "Metadata");
    }
}

TEST_F(SchematicTest, MissingVersion) {
    NbtCompound root = makeHouse().toNbt();
    ASSERT_TRUE(root.remove("Version"));
    try {
        (void)Schematic::fromNbt(root);
        FAIL() << "Expected SchematicError";
    } catch (const SchematicError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MissingField);
        EXPECT_EQ(e.field(), "Version");
    }
}

TEST_F(SchematicTest, BadRegionIsNamed) {
    NbtCompound root = makeHouse().toNbt();
    NbtCompound broken;
    broken.insert("Position", blockPosToNbt(BlockPos(0, 0, 0)));
    broken.insert("Size", blockPosToNbt(BlockPos(1, 1, 1)));
    NbtList palette;
    palette.push(BlockState::air().toNbt());
    broken.insert("BlockStatePalette", std::move(palette));
    NbtCompound regions = root.getCompound("Regions").clone();
    regions.insert("broken", std::move(broken));
    root.insert("Regions", std::move(regions));

    try {
        (void)Schematic::fromNbt(root);
        FAIL() << "Expected SchematicError";
    } catch (const SchematicError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MissingField);
        EXPECT_EQ(e.field(), "BlockStates");
        EXPECT_NE(std::string(e.what()).find("broken"), std::string::npos);
    }
}

TEST_F(SchematicTest, RegionMustBeCompound) {
    NbtCompound root = makeHouse().toNbt();
    NbtCompound regions = root.getCompound("Regions").clone();
    regions.insert("odd", int32_t{1});
    root.insert("Regions", std::move(regions));
    try {
        (void)Schematic::fromNbt(root);
        FAIL() << "Expected SchematicError";
    } catch (const SchematicError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::WrongType);
        EXPECT_EQ(e.field(), "odd");
    }
}

TEST_F(SchematicTest, GarbageBufferIsMalformed) {
    std::vector<uint8_t> garbage = {0x01, 0x02, 0x03};
    try {
        (void)Schematic::fromBuffer(garbage);
        FAIL() << "Expected SchematicError";
    } catch (const SchematicError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedDocument);
    }

    std::vector<uint8_t> gzipHeaderOnly = {0x1f, 0x8b, 0x08, 0x00};
    EXPECT_THROW((void)Schematic::fromBuffer(gzipHeaderOnly), SchematicError);
}

TEST_F(SchematicTest, ExtraRootFieldsAreIgnored) {
    NbtCompound root = makeHouse().toNbt();
    root.insert("SubVersion", int32_t{1});
    Schematic decoded = Schematic::fromNbt(root);
    EXPECT_EQ(decoded.regionCount(), 2u);
}

// ============================================================================
// Files
// ============================================================================

TEST_F(SchematicFileTest, SaveAndLoad) {
    auto path = tempDir / "house.litematic";
    Schematic original = makeHouse();
    original.toFile(path);

    ASSERT_TRUE(std::filesystem::exists(path));
    Schematic loaded = Schematic::fromFile(path);
    expectSameSchematic(original, loaded);

    // Default envelope is gzip
    std::ifstream file(path, std::ios::binary);
    unsigned char magic[2] = {};
    file.read(reinterpret_cast<char*>(magic), 2);
    EXPECT_EQ(magic[0], 0x1f);
    EXPECT_EQ(magic[1], 0x8b);
}

TEST_F(SchematicFileTest, SaveAndLoadLz4) {
    auto path = tempDir / "house.lz4.litematic";
    Schematic original = makeHouse();
    original.toFile(path, Compression::Lz4);
    expectSameSchematic(original, Schematic::fromFile(path));
}

TEST_F(SchematicFileTest, MissingFileThrows) {
    EXPECT_THROW((void)Schematic::fromFile(tempDir / "nonexistent.litematic"), std::runtime_error);
}

TEST_F(SchematicFileTest, UnwritablePathThrows) {
    EXPECT_THROW(makeHouse().toFile(tempDir / "no_such_dir" / "out.litematic"), std::runtime_error);
}
