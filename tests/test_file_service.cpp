#include <gtest/gtest.h>
#include <managers/connection_manager.hpp>
#include <managers/file_service.hpp>
#include <sstream>
#include "common/fake_transport.hpp"

class FileServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        remote = std::make_shared<FakeRemote>();
        connection = std::make_unique<ConnectionManager>(fake_transport_factory(remote),
                                                         TransportOptions{}, fast_reconnect(2));
        ASSERT_TRUE(connection->connect(fake_credentials()).is_ok());
        files = std::make_unique<FileService>(*connection);

        remote->add_dir("/srv");
        remote->add_dir("/srv/app");
        remote->add_dir("/srv/Logs");
        remote->add_file("/srv/b.txt", "bee");
        remote->add_file("/srv/A.txt", "ay");
        remote->add_file("/srv/app/main.py", "print('hi')\n");
    }

    FakeRemotePtr remote;
    std::unique_ptr<ConnectionManager> connection;
    std::unique_ptr<FileService> files;
};

TEST_F(FileServiceTest, ListPutsDirectoriesFirstThenCaseInsensitive) {
    auto r = files->list("/srv/");
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 4u);
    EXPECT_EQ(r.value[0].name, "app");
    EXPECT_EQ(r.value[1].name, "Logs");
    EXPECT_EQ(r.value[2].name, "A.txt");
    EXPECT_EQ(r.value[3].name, "b.txt");
    EXPECT_EQ(r.value[0].path, "/srv/app");
    EXPECT_TRUE(r.value[0].is_dir());
    EXPECT_EQ(r.value[3].size, 3u);
}

TEST_F(FileServiceTest, ListMissingDirectory) {
    EXPECT_EQ(files->list("/nope").kind, ErrorKind::PathNotFound);
}

TEST_F(FileServiceTest, EmptyPathIsInvalid) {
    EXPECT_EQ(files->list("").kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(files->read("").kind, ErrorKind::InvalidArgument);
}

TEST_F(FileServiceTest, StatDoesNotFollowSymlinks) {
    remote->add_symlink("/srv/current", "/srv/app");
    auto r = files->stat("/srv/current");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.kind, FileKind::Symlink);
    EXPECT_EQ(r.value.name, "current");
}

TEST_F(FileServiceTest, StatFollowsSymlinksWhenAsked) {
    remote->add_symlink("/srv/current", "/srv/app");
    auto r = files->stat("/srv/current", true);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.kind, FileKind::Directory);
    EXPECT_EQ(r.value.path, "/srv/current");
    EXPECT_EQ(r.value.name, "current");

    remote->add_symlink("/srv/dangling", "/srv/nowhere");
    EXPECT_EQ(files->stat("/srv/dangling", true).kind, ErrorKind::PathNotFound);
    EXPECT_TRUE(files->stat("/srv/dangling").is_ok());
}

TEST_F(FileServiceTest, ReadFileAndDirectory) {
    auto r = files->read("/srv/app/../app/main.py");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "print('hi')\n");

    EXPECT_EQ(files->read("/srv/app").kind, ErrorKind::IsADirectory);
    EXPECT_EQ(files->read("/srv/missing").kind, ErrorKind::PathNotFound);
}

TEST_F(FileServiceTest, WriteReadAcrossChunkBoundaries) {
    for (size_t size : {size_t(0), size_t(1), size_t(SFTP_CHUNK_SIZE), size_t(SFTP_CHUNK_SIZE + 1),
                        size_t(3 * SFTP_CHUNK_SIZE + 17)}) {
        std::string content(size, '\0');
        for (size_t i = 0; i < size; i++) content[i] = static_cast<char>(i * 31 + 7);

        ASSERT_TRUE(files->write("/srv/blob.bin", content).is_ok()) << size;
        auto back = files->read("/srv/blob.bin");
        ASSERT_TRUE(back.is_ok());
        EXPECT_EQ(back.value, content) << size;
    }
    EXPECT_TRUE(remote->find(TEMP_UPLOAD_TAG).empty());
}

TEST_F(FileServiceTest, WriteReplacesExistingContent) {
    ASSERT_TRUE(files->write("/srv/b.txt", "replaced").is_ok());
    EXPECT_EQ(remote->content("/srv/b.txt"), "replaced");
    EXPECT_TRUE(remote->find(TEMP_UPLOAD_TAG).empty());
}

TEST_F(FileServiceTest, WriteFallsBackWhenOverwriteRenameIsRefused) {
    remote->refuse_overwrite_rename = true;
    ASSERT_TRUE(files->write("/srv/b.txt", "fallback").is_ok());
    EXPECT_EQ(remote->content("/srv/b.txt"), "fallback");
    EXPECT_TRUE(remote->find(TEMP_UPLOAD_TAG).empty());
}

TEST_F(FileServiceTest, FailedCloseLeavesTargetUntouched) {
    remote->fail_close = true;
    auto r = files->write("/srv/b.txt", "never committed");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::OperationFailed);
    EXPECT_EQ(remote->content("/srv/b.txt"), "bee");
    EXPECT_TRUE(remote->find(TEMP_UPLOAD_TAG).empty());

    std::istringstream in("streamed");
    EXPECT_TRUE(files->upload(in, "/srv/new.txt").is_err());
    EXPECT_FALSE(remote->exists("/srv/new.txt"));
    EXPECT_TRUE(remote->find(TEMP_UPLOAD_TAG).empty());

    remote->fail_close = false;
    EXPECT_TRUE(files->write("/srv/b.txt", "committed").is_ok());
    EXPECT_EQ(remote->content("/srv/b.txt"), "committed");
}

TEST_F(FileServiceTest, WriteOntoDirectoryFails) {
    EXPECT_EQ(files->write("/srv/app", "x").kind, ErrorKind::IsADirectory);
    EXPECT_EQ(files->write("/", "x").kind, ErrorKind::IsADirectory);
}

TEST_F(FileServiceTest, WriteIntoMissingDirectoryFails) {
    EXPECT_EQ(files->write("/nowhere/file.txt", "x").kind, ErrorKind::PathNotFound);
}

TEST_F(FileServiceTest, CreateRefusesExistingTargets) {
    ASSERT_TRUE(files->create_directory("/srv/new").is_ok());
    ASSERT_TRUE(files->create_file("/srv/new/empty.txt").is_ok());
    EXPECT_TRUE(remote->exists("/srv/new/empty.txt"));
    EXPECT_EQ(remote->content("/srv/new/empty.txt"), "");

    auto dup_dir = files->create_directory("/srv/new");
    EXPECT_EQ(dup_dir.kind, ErrorKind::OperationFailed);
    EXPECT_NE(dup_dir.error.find("already exists"), std::string::npos);
    EXPECT_EQ(files->create_file("/srv/b.txt").kind, ErrorKind::OperationFailed);
    EXPECT_EQ(remote->content("/srv/b.txt"), "bee");
}

TEST_F(FileServiceTest, RemoveIsRecursive) {
    remote->add_dir("/srv/app/pkg");
    remote->add_file("/srv/app/pkg/mod.py", "x = 1\n");

    ASSERT_TRUE(files->remove("/srv/app").is_ok());
    EXPECT_FALSE(remote->exists("/srv/app"));
    EXPECT_FALSE(remote->exists("/srv/app/pkg/mod.py"));
    EXPECT_TRUE(remote->exists("/srv/b.txt"));
}

TEST_F(FileServiceTest, RemoveSymlinkLeavesTarget) {
    remote->add_symlink("/srv/link", "/srv/app");
    ASSERT_TRUE(files->remove("/srv/link").is_ok());
    EXPECT_FALSE(remote->exists("/srv/link"));
    EXPECT_TRUE(remote->exists("/srv/app/main.py"));
}

TEST_F(FileServiceTest, RemoveRootIsRefused) {
    EXPECT_EQ(files->remove("/").kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(files->remove("/srv/..").kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(files->remove("/srv/ghost").kind, ErrorKind::PathNotFound);
}

TEST_F(FileServiceTest, RenameMovesAndRefusesExistingTarget) {
    ASSERT_TRUE(files->rename("/srv/app", "/srv/service").is_ok());
    EXPECT_TRUE(remote->exists("/srv/service/main.py"));
    EXPECT_FALSE(remote->exists("/srv/app"));

    auto clash = files->rename("/srv/A.txt", "/srv/b.txt");
    EXPECT_EQ(clash.kind, ErrorKind::OperationFailed);
    EXPECT_EQ(remote->content("/srv/b.txt"), "bee");
    EXPECT_EQ(files->rename("/srv/ghost", "/srv/x").kind, ErrorKind::PathNotFound);
}

TEST_F(FileServiceTest, UploadAndDownloadStream) {
    std::string payload(2 * SFTP_CHUNK_SIZE + 5, 'u');
    std::istringstream in(payload);
    auto up = files->upload(in, "/srv/upload.dat");
    ASSERT_TRUE(up.is_ok()) << up.error;
    EXPECT_EQ(up.value.bytes, payload.size());

    std::string received;
    auto down = files->download("/srv/upload.dat", [&](const char* data, size_t len) {
        received.append(data, len);
        return true;
    });
    ASSERT_TRUE(down.is_ok());
    EXPECT_EQ(down.value.bytes, payload.size());
    EXPECT_EQ(received, payload);
}

TEST_F(FileServiceTest, CancelledUploadLeavesTargetUntouched) {
    CancelToken cancel;
    cancel.cancel();
    std::istringstream in("new content");
    auto r = files->upload(in, "/srv/b.txt", &cancel);
    EXPECT_EQ(r.kind, ErrorKind::Cancelled);
    EXPECT_EQ(remote->content("/srv/b.txt"), "bee");
    EXPECT_TRUE(remote->find(TEMP_UPLOAD_TAG).empty());
}

TEST_F(FileServiceTest, DownloadDirectoryAndReceiverAbort) {
    auto sink = [](const char*, size_t) { return true; };
    EXPECT_EQ(files->download("/srv/app", sink).kind, ErrorKind::IsADirectory);

    auto refusing = [](const char*, size_t) { return false; };
    EXPECT_EQ(files->download("/srv/b.txt", refusing).kind, ErrorKind::Cancelled);
}

TEST_F(FileServiceTest, TransportFaultIsReportedAndRecovered) {
    remote->dropped = true;
    // The channel open notices the dead transport and reconnects first
    auto r = files->read("/srv/b.txt");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "bee");
    EXPECT_EQ(connection->info().reconnects, 1);
}
