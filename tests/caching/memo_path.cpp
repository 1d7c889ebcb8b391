#include <memo/caching/memo_path.hpp>

#include <memo/core/testing.hpp>

using namespace memo;

namespace {

char const* const test_file_name
    = "test&pixelType=int8&sizeX=20&sizeY=20&sizeC=1&sizeZ=1&sizeT=1.fake";

} // namespace

TEST_CASE("memo file names", "[caching][memo_path]")
{
    REQUIRE(
        get_memo_file_name("/data/images/cells.tif").string()
        == ".cells.tif.bfmemo");
    REQUIRE(
        get_memo_file_name(file_path("/data") / test_file_name).string()
        == string(".") + test_file_name + ".bfmemo");
}

TEST_CASE("canonical source paths", "[caching][memo_path]")
{
    REQUIRE(get_canonical_source_path("") == none);
    REQUIRE(get_canonical_source_path("/data/images/") == none);

    auto canonical = get_canonical_source_path("/data/./raw/../images/a.tif");
    REQUIRE(canonical);
    REQUIRE(canonical->string() == "/data/images/a.tif");

    // Relative paths are made absolute.
    auto relative = get_canonical_source_path("a.tif");
    REQUIRE(relative);
    REQUIRE(relative->is_absolute());
    REQUIRE(relative->filename().string() == "a.tif");
}

TEST_CASE("disabled memo paths", "[caching][memo_path]")
{
    REQUIRE(resolve_memo_path("/data/a.tif", memo_config()) == none);
}

TEST_CASE("in-place memo paths", "[caching][memo_path]")
{
    scoped_directory scratch(make_scratch_directory("in_place"));
    auto source = scratch.path / test_file_name;

    auto memo_path = resolve_memo_path(source, in_place_memo_config());
    REQUIRE(memo_path);
    REQUIRE(
        memo_path->string()
        == (scratch.path / (string(".") + test_file_name + ".bfmemo"))
               .string());

    // The source doesn't need to exist for its memo path to be resolved.
    REQUIRE(!exists(source));
}

TEST_CASE("directory memo paths", "[caching][memo_path]")
{
    scoped_directory cache_root(make_scratch_directory("cache_root"));
    scoped_directory source_dir(make_scratch_directory("sources"));
    auto source = source_dir.path / test_file_name;
    auto config = memo_config_for_directory(cache_root.path);

    auto memo_path = resolve_memo_path(source, config);
    REQUIRE(memo_path);
    // The memo file mirrors the source's absolute directory beneath the
    // cache root.
    auto expected = cache_root.path / source_dir.path.relative_path()
                    / (string(".") + test_file_name + ".bfmemo");
    REQUIRE(memo_path->string() == expected.string());

    // Resolving the path doesn't create anything.
    REQUIRE(!exists(memo_path->parent_path()));

    // Resolution is repeatable.
    REQUIRE(resolve_memo_path(source, config) == memo_path);

    // Sources with the same name in different directories don't collide.
    auto other_source = source_dir.path / "nested" / test_file_name;
    auto other_memo_path = resolve_memo_path(other_source, config);
    REQUIRE(other_memo_path);
    REQUIRE(other_memo_path->string() != memo_path->string());
}

TEST_CASE("missing cache roots", "[caching][memo_path]")
{
    scoped_directory scratch(make_scratch_directory("missing_root"));
    auto missing_root = scratch.path / "not_there";
    auto config = memo_config_for_directory(missing_root);

    REQUIRE(resolve_memo_path(scratch.path / test_file_name, config) == none);
    // The cache root isn't created on demand.
    REQUIRE(!exists(missing_root));

    // A cache root that's actually a file is no better.
    auto file_root = scratch.path / "a_file";
    dump_string_to_file(file_root, "");
    REQUIRE(
        resolve_memo_path(
            scratch.path / test_file_name,
            memo_config_for_directory(file_root))
        == none);
}

TEST_CASE("filesystem root as cache root", "[caching][memo_path]")
{
    scoped_directory scratch(make_scratch_directory("fs_root"));
    auto source = scratch.path / test_file_name;
    auto root = source.root_path();

    auto under_root
        = resolve_memo_path(source, memo_config_for_directory(root));
    auto in_place = resolve_memo_path(source, in_place_memo_config());
    REQUIRE(under_root);
    REQUIRE(in_place);
    REQUIRE(under_root->string() == in_place->string());
}
