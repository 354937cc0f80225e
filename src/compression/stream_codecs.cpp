#include "chunkvault/compression/compression_codec.hpp"

#include <bzlib.h>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <vector>
#include <zlib.h>
#include <zstd.h>

namespace chunkvault {

namespace {

constexpr size_t STREAM_WINDOW = 64 * 1024;

// Reads up to buffer.size() bytes, returns the count.
size_t readWindow(std::istream &in, std::vector<char> &buffer) {
  in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
  if (in.bad()) {
    throw std::runtime_error("Read error on compression input");
  }
  return static_cast<size_t>(in.gcount());
}

void writeWindow(std::ostream &out, const char *data, size_t size) {
  if (size == 0)
    return;
  out.write(data, static_cast<std::streamsize>(size));
  if (!out) {
    throw std::runtime_error("Write error on compression output");
  }
}

class ZstdStreamCodec : public StreamCodec {
public:
  CompressionAlgorithm algorithm() const override {
    return CompressionAlgorithm::ZSTD;
  }
  int minLevel() const override { return 1; }
  int maxLevel() const override { return ZSTD_maxCLevel(); }

  void compress(std::istream &in, std::ostream &out, int level) override {
    std::unique_ptr<ZSTD_CCtx, decltype(&ZSTD_freeCCtx)> cctx(
        ZSTD_createCCtx(), &ZSTD_freeCCtx);
    if (!cctx) {
      throw std::runtime_error("ZSTD_createCCtx failed");
    }
    check(ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_compressionLevel, level));
    check(ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_checksumFlag, 1));

    std::vector<char> inBuf(ZSTD_CStreamInSize());
    std::vector<char> outBuf(ZSTD_CStreamOutSize());
    for (;;) {
      size_t got = readWindow(in, inBuf);
      const bool last = got < inBuf.size();
      const ZSTD_EndDirective mode = last ? ZSTD_e_end : ZSTD_e_continue;
      ZSTD_inBuffer input = {inBuf.data(), got, 0};
      bool finished = false;
      do {
        ZSTD_outBuffer output = {outBuf.data(), outBuf.size(), 0};
        size_t remaining =
            check(ZSTD_compressStream2(cctx.get(), &output, &input, mode));
        writeWindow(out, outBuf.data(), output.pos);
        finished = last ? (remaining == 0) : (input.pos == input.size);
      } while (!finished);
      if (last)
        break;
    }
  }

  void decompress(std::istream &in, std::ostream &out) override {
    std::unique_ptr<ZSTD_DCtx, decltype(&ZSTD_freeDCtx)> dctx(
        ZSTD_createDCtx(), &ZSTD_freeDCtx);
    if (!dctx) {
      throw std::runtime_error("ZSTD_createDCtx failed");
    }
    std::vector<char> inBuf(ZSTD_DStreamInSize());
    std::vector<char> outBuf(ZSTD_DStreamOutSize());
    size_t lastRet = 0;
    bool sawInput = false;
    size_t got = 0;
    while ((got = readWindow(in, inBuf)) > 0) {
      sawInput = true;
      ZSTD_inBuffer input = {inBuf.data(), got, 0};
      bool outputFull = false;
      do {
        ZSTD_outBuffer output = {outBuf.data(), outBuf.size(), 0};
        lastRet = check(ZSTD_decompressStream(dctx.get(), &output, &input));
        writeWindow(out, outBuf.data(), output.pos);
        outputFull = output.pos == output.size;
      } while (input.pos < input.size || outputFull);
    }
    if (!sawInput) {
      throw std::runtime_error("ZSTD input is empty");
    }
    if (lastRet != 0) {
      throw std::runtime_error("ZSTD input is truncated");
    }
  }

private:
  static size_t check(size_t code) {
    if (ZSTD_isError(code)) {
      throw std::runtime_error(std::string("ZSTD error: ") +
                               ZSTD_getErrorName(code));
    }
    return code;
  }
};

class ZlibStreamCodec : public StreamCodec {
public:
  CompressionAlgorithm algorithm() const override {
    return CompressionAlgorithm::ZLIB;
  }
  int minLevel() const override { return 1; }
  int maxLevel() const override { return 9; }

  void compress(std::istream &in, std::ostream &out, int level) override {
    z_stream strm{};
    if (deflateInit(&strm, level) != Z_OK) {
      throw std::runtime_error("deflateInit failed");
    }
    std::unique_ptr<z_stream, int (*)(z_stream *)> guard(&strm, &deflateEnd);

    std::vector<char> inBuf(STREAM_WINDOW);
    std::vector<char> outBuf(STREAM_WINDOW);
    int flush = Z_NO_FLUSH;
    do {
      size_t got = readWindow(in, inBuf);
      flush = in.eof() ? Z_FINISH : Z_NO_FLUSH;
      strm.next_in = reinterpret_cast<Bytef *>(inBuf.data());
      strm.avail_in = static_cast<uInt>(got);
      do {
        strm.next_out = reinterpret_cast<Bytef *>(outBuf.data());
        strm.avail_out = static_cast<uInt>(outBuf.size());
        if (deflate(&strm, flush) == Z_STREAM_ERROR) {
          throw std::runtime_error("deflate failed");
        }
        writeWindow(out, outBuf.data(), outBuf.size() - strm.avail_out);
      } while (strm.avail_out == 0);
    } while (flush != Z_FINISH);
  }

  void decompress(std::istream &in, std::ostream &out) override {
    z_stream strm{};
    if (inflateInit(&strm) != Z_OK) {
      throw std::runtime_error("inflateInit failed");
    }
    std::unique_ptr<z_stream, int (*)(z_stream *)> guard(&strm, &inflateEnd);

    std::vector<char> inBuf(STREAM_WINDOW);
    std::vector<char> outBuf(STREAM_WINDOW);
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
      size_t got = readWindow(in, inBuf);
      if (got == 0)
        break;
      strm.next_in = reinterpret_cast<Bytef *>(inBuf.data());
      strm.avail_in = static_cast<uInt>(got);
      do {
        strm.next_out = reinterpret_cast<Bytef *>(outBuf.data());
        strm.avail_out = static_cast<uInt>(outBuf.size());
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
            ret == Z_STREAM_ERROR) {
          throw std::runtime_error(std::string("inflate failed: ") +
                                   (strm.msg ? strm.msg : "corrupt input"));
        }
        writeWindow(out, outBuf.data(), outBuf.size() - strm.avail_out);
      } while (strm.avail_out == 0 && ret != Z_STREAM_END);
    }
    if (ret != Z_STREAM_END) {
      throw std::runtime_error("zlib input is truncated");
    }
  }
};

class Bzip2StreamCodec : public StreamCodec {
public:
  CompressionAlgorithm algorithm() const override {
    return CompressionAlgorithm::BZIP2;
  }
  // bzip2 levels are block sizes in units of 100k.
  int minLevel() const override { return 1; }
  int maxLevel() const override { return 9; }

  void compress(std::istream &in, std::ostream &out, int level) override {
    bz_stream strm{};
    if (BZ2_bzCompressInit(&strm, level, 0, 0) != BZ_OK) {
      throw std::runtime_error("BZ2_bzCompressInit failed");
    }
    std::unique_ptr<bz_stream, int (*)(bz_stream *)> guard(&strm,
                                                           &BZ2_bzCompressEnd);

    std::vector<char> inBuf(STREAM_WINDOW);
    std::vector<char> outBuf(STREAM_WINDOW);
    for (;;) {
      size_t got = readWindow(in, inBuf);
      const int action = in.eof() ? BZ_FINISH : BZ_RUN;
      strm.next_in = inBuf.data();
      strm.avail_in = static_cast<unsigned int>(got);
      int ret = BZ_RUN_OK;
      do {
        strm.next_out = outBuf.data();
        strm.avail_out = static_cast<unsigned int>(outBuf.size());
        ret = BZ2_bzCompress(&strm, action);
        if (ret < 0) {
          throw std::runtime_error("BZ2_bzCompress failed with code " +
                                   std::to_string(ret));
        }
        writeWindow(out, outBuf.data(), outBuf.size() - strm.avail_out);
      } while (action == BZ_RUN ? strm.avail_in > 0 : ret != BZ_STREAM_END);
      if (action == BZ_FINISH)
        break;
    }
  }

  void decompress(std::istream &in, std::ostream &out) override {
    bz_stream strm{};
    if (BZ2_bzDecompressInit(&strm, 0, 0) != BZ_OK) {
      throw std::runtime_error("BZ2_bzDecompressInit failed");
    }
    std::unique_ptr<bz_stream, int (*)(bz_stream *)> guard(
        &strm, &BZ2_bzDecompressEnd);

    std::vector<char> inBuf(STREAM_WINDOW);
    std::vector<char> outBuf(STREAM_WINDOW);
    int ret = BZ_OK;
    while (ret != BZ_STREAM_END) {
      size_t got = readWindow(in, inBuf);
      if (got == 0)
        break;
      strm.next_in = inBuf.data();
      strm.avail_in = static_cast<unsigned int>(got);
      do {
        strm.next_out = outBuf.data();
        strm.avail_out = static_cast<unsigned int>(outBuf.size());
        ret = BZ2_bzDecompress(&strm);
        if (ret != BZ_OK && ret != BZ_STREAM_END) {
          throw std::runtime_error("BZ2_bzDecompress failed with code " +
                                   std::to_string(ret));
        }
        writeWindow(out, outBuf.data(), outBuf.size() - strm.avail_out);
      } while ((strm.avail_in > 0 || strm.avail_out == 0) &&
               ret != BZ_STREAM_END);
    }
    if (ret != BZ_STREAM_END) {
      throw std::runtime_error("bzip2 input is truncated");
    }
  }
};

} // namespace

std::unique_ptr<StreamCodec> makeStreamCodec(CompressionAlgorithm algo) {
  switch (algo) {
  case CompressionAlgorithm::ZSTD:
    return std::make_unique<ZstdStreamCodec>();
  case CompressionAlgorithm::ZLIB:
    return std::make_unique<ZlibStreamCodec>();
  case CompressionAlgorithm::BZIP2:
    return std::make_unique<Bzip2StreamCodec>();
  }
  throw std::invalid_argument("Unsupported compression algorithm");
}

} // namespace chunkvault
