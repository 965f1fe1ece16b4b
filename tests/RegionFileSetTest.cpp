// Assertions are the test checks, keep them in release builds.
#undef NDEBUG
#include <cassert>
#include <atomic>
#include <filesystem>
#include <iostream>
#include <thread>
#include <vector>

#include "RegionErrors.hpp"
#include "RegionFileSet.hpp"
#include "TestTempDir.hpp"

using namespace ChunkVault;

namespace
{

RegionStorageConfig MakeConfig(const std::filesystem::path& world_dir, const uint32_t max_open_regions)
{
	RegionStorageConfig config;
	config.world_dir= world_dir;
	config.max_open_regions= max_open_regions;
	config.sync_writes= false;
	return config;
}

ByteBuffer MakePayload(const ChunkCoord coord, const size_t size)
{
	ByteBuffer result(size);
	for(size_t i= 0; i < size; ++i)
		result[i]= uint8_t(uint32_t(coord.cx) * 31u + uint32_t(coord.cz) * 17u + i / 7u);
	return result;
}

} // namespace

void TestFileNaming()
{
	std::cout << "Testing region file naming..." << std::endl;

	TestTempDir dir("set_naming");
	RegionFileSet set(MakeConfig(dir.GetPath(), 4));

	assert(set.GetRegionFilePath({0, 0}) == dir.GetPath() / "r.0.0.mca");
	assert(set.GetRegionFilePath({-1, 2}) == dir.GetPath() / "r.-1.2.mca");
	assert(set.GetRegionFilePath({-20, -1}) == dir.GetPath() / "r.-20.-1.mca");

	std::cout << "  File naming: PASS" << std::endl;
}

void TestLazyCreation()
{
	std::cout << "Testing lazy creation..." << std::endl;

	TestTempDir dir("set_lazy");
	const std::filesystem::path world_dir= dir.GetPath() / "world" / "region";
	RegionFileSet set(MakeConfig(world_dir, 4));

	// Reading doesn't create anything.
	assert(set.LoadChunk({5, 5}) == std::nullopt);
	assert(!set.HasChunk({5, 5}));
	assert(set.GetChunkTimestamp({5, 5}) == std::nullopt);
	set.DeleteChunk({5, 5});
	assert(!std::filesystem::exists(world_dir));
	assert(set.GetOpenRegionCount() == 0);

	// Saving creates directories and file.
	const ByteBuffer payload= MakePayload({-626, -4}, 1000);
	set.SaveChunk({-626, -4}, payload);
	assert(std::filesystem::exists(world_dir / "r.-20.-1.mca"));
	assert(set.IsOpen({-20, -1}));
	assert(set.LoadChunk({-626, -4}) == payload);
	assert(set.HasChunk({-626, -4}));
	assert(set.GetChunkTimestamp({-626, -4}) != std::nullopt);

	// Get creates empty region.
	const RegionFileSet::RegionFilePtr region= set.Get({7, 7});
	assert(region != nullptr && region->CountChunks() == 0);
	assert(std::filesystem::file_size(world_dir / "r.7.7.mca") == c_header_size);

	set.DeleteChunk({-626, -4});
	assert(set.LoadChunk({-626, -4}) == std::nullopt);

	std::cout << "  Lazy creation: PASS" << std::endl;
}

void TestSameInstance()
{
	std::cout << "Testing single instance per region..." << std::endl;

	TestTempDir dir("set_instance");
	RegionFileSet set(MakeConfig(dir.GetPath(), 4));

	const RegionFileSet::RegionFilePtr a= set.Get({1, 2});
	const RegionFileSet::RegionFilePtr b= set.Get({1, 2});
	assert(a == b);
	assert(a->GetRegionCoord() == (RegionCoord{1, 2}));
	assert(set.GetOpenRegionCount() == 1);

	std::cout << "  Single instance: PASS" << std::endl;
}

void TestLruEviction()
{
	std::cout << "Testing LRU eviction..." << std::endl;

	TestTempDir dir("set_lru");
	RegionFileSet set(MakeConfig(dir.GetPath(), 2));

	set.SaveChunk({0, 0}, MakePayload({0, 0}, 100));
	set.SaveChunk({32, 0}, MakePayload({32, 0}, 100));
	assert(set.GetOpenRegionCount() == 2);

	// Touch region 0 so region 1 becomes least recently used.
	assert(set.HasChunk({0, 0}));
	set.SaveChunk({64, 0}, MakePayload({64, 0}, 100));

	assert(set.GetOpenRegionCount() == 2);
	assert(set.IsOpen({0, 0}));
	assert(!set.IsOpen({1, 0}));
	assert(set.IsOpen({2, 0}));

	// Evicted region is reopened on demand with its data intact.
	assert(set.LoadChunk({32, 0}) == MakePayload({32, 0}, 100));
	assert(set.IsOpen({1, 0}));
	assert(!set.IsOpen({0, 0}));
	assert(set.GetOpenRegionCount() == 2);

	std::cout << "  LRU eviction: PASS" << std::endl;
}

void TestEvictedHandleReused()
{
	std::cout << "Testing reuse of evicted region in use..." << std::endl;

	TestTempDir dir("set_evicted_handle");
	RegionFileSet set(MakeConfig(dir.GetPath(), 1));

	const RegionFileSet::RegionFilePtr held= set.Get({0, 0});
	set.Get({1, 0});
	assert(!set.IsOpen({0, 0}));

	// Handle stays usable after eviction.
	const ByteBuffer payload= MakePayload({3, 3}, 500);
	held->Save({3, 3}, payload, Compression::GZip);

	// Set returns the same object, not a second instance of the same file.
	const RegionFileSet::RegionFilePtr again= set.Get({0, 0});
	assert(again == held);
	assert(set.LoadChunk({3, 3}) == payload);

	// Same after explicit close.
	assert(set.Close({0, 0}));
	assert(set.Get({0, 0}) == held);

	std::cout << "  Evicted handle reused: PASS" << std::endl;
}

void TestCloseAndReopen()
{
	std::cout << "Testing close and reopen..." << std::endl;

	TestTempDir dir("set_close");
	const ByteBuffer payload_a= MakePayload({-1, -1}, 20000);
	const ByteBuffer payload_b= MakePayload({100, 100}, 3000);
	{
		RegionFileSet set(MakeConfig(dir.GetPath(), 8));
		set.SaveChunk({-1, -1}, payload_a, Compression::GZip);
		set.SaveChunk({100, 100}, payload_b, Compression::None);

		assert(set.Close({-1, -1}));
		assert(!set.Close({-1, -1}));
		assert(!set.IsOpen({-1, -1}));
		assert(set.GetOpenRegionCount() == 1);

		set.CloseAll();
		assert(set.GetOpenRegionCount() == 0);
		assert(!set.Close({3, 3}));
	}
	{
		RegionFileSet set(MakeConfig(dir.GetPath(), 8));
		assert(set.LoadChunk({-1, -1}) == payload_a);
		assert(set.LoadChunk({100, 100}) == payload_b);
		assert(set.LoadChunk({-2, -1}) == std::nullopt);
	}

	std::cout << "  Close and reopen: PASS" << std::endl;
}

void TestHandleKeptAcrossCloseAll()
{
	std::cout << "Testing handle kept across close of all regions..." << std::endl;

	TestTempDir dir("set_close_all_handle");
	RegionFileSet set(MakeConfig(dir.GetPath(), 4));

	const RegionFileSet::RegionFilePtr held= set.Get({0, 0});
	set.SaveChunk({0, 0}, MakePayload({0, 0}, 100));
	set.Get({1, 1});

	set.CloseAll();
	assert(set.GetOpenRegionCount() == 0);

	// No second instance of the same file, so both handles share one allocator.
	const RegionFileSet::RegionFilePtr again= set.Get({0, 0});
	assert(again == held);

	const ByteBuffer payload_1= MakePayload({1, 0}, 3000);
	const ByteBuffer payload_2= MakePayload({2, 0}, 3000);
	held->Save({1, 0}, payload_1, Compression::None);
	again->Save({2, 0}, payload_2, Compression::None);

	assert(held->FindExtent(1) != again->FindExtent(2));
	assert(set.LoadChunk({0, 0}) == MakePayload({0, 0}, 100));
	assert(set.LoadChunk({1, 0}) == payload_1);
	assert(set.LoadChunk({2, 0}) == payload_2);

	std::cout << "  Handle kept across close all: PASS" << std::endl;
}

void TestConcurrentAccess()
{
	std::cout << "Testing concurrent access..." << std::endl;

	TestTempDir dir("set_concurrent");
	RegionFileSet set(MakeConfig(dir.GetPath(), 3));

	constexpr int32_t c_thread_count= 8;
	constexpr int32_t c_chunks_per_thread= 48;

	// Chunks of each thread are spread across several regions, so regions are shared and evicted often.
	const auto chunk_for= [](const int32_t thread_index, const int32_t i)
	{
		return ChunkCoord{ (i % 6) * 16 - 40, thread_index * 5 + (i / 6) * 40 - 100 };
	};

	std::atomic<int> failures{0};
	std::vector<std::thread> threads;
	for(int32_t t= 0; t < c_thread_count; ++t)
	{
		threads.emplace_back(
			[&, t]
			{
				for(int32_t i= 0; i < c_chunks_per_thread; ++i)
				{
					const ChunkCoord coord= chunk_for(t, i);
					const ByteBuffer payload= MakePayload(coord, size_t(100 + i * 97));
					set.SaveChunk(coord, payload);
					if(set.LoadChunk(coord) != payload)
						++failures;
				}
			});
	}
	for(std::thread& thread : threads)
		thread.join();

	assert(failures == 0);
	assert(set.GetOpenRegionCount() <= 3);

	for(int32_t t= 0; t < c_thread_count; ++t)
		for(int32_t i= 0; i < c_chunks_per_thread; ++i)
		{
			const ChunkCoord coord= chunk_for(t, i);
			assert(set.LoadChunk(coord) == MakePayload(coord, size_t(100 + i * 97)));
		}

	std::cout << "  Concurrent access: PASS" << std::endl;
}

int main()
{
	std::cout << "=== Running region file set tests ===" << std::endl;

	TestFileNaming();
	TestLazyCreation();
	TestSameInstance();
	TestLruEviction();
	TestEvictedHandleReused();
	TestCloseAndReopen();
	TestHandleKeptAcrossCloseAll();
	TestConcurrentAccess();

	std::cout << "All tests PASSED!" << std::endl;
	return 0;
}
