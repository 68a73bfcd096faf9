#include "pomelo/dns_parser.hpp"

namespace pomelo {

namespace {

inline uint16_t readU16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, sizeof(v));
    return ntohs(v);
}

inline uint32_t readU32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, sizeof(v));
    return ntohl(v);
}

inline void putU16(std::vector<uint8_t>* out, uint16_t v) {
    out->push_back(static_cast<uint8_t>(v >> 8));
    out->push_back(static_cast<uint8_t>(v & 0xFF));
}

inline void putU32(std::vector<uint8_t>* out, uint32_t v) {
    putU16(out, static_cast<uint16_t>(v >> 16));
    putU16(out, static_cast<uint16_t>(v & 0xFFFF));
}

inline void patchU16(std::vector<uint8_t>* out, size_t offset, uint16_t v) {
    (*out)[offset] = static_cast<uint8_t>(v >> 8);
    (*out)[offset + 1] = static_cast<uint8_t>(v & 0xFF);
}

// OPT 伪记录: 根域名(1) + 类型(2) + UDP 大小(2) + TTL(4) + RDLENGTH(2)
constexpr size_t OPT_RECORD_SIZE = 11;

} // anonymous namespace

Error DNSParser::parse(
    const uint8_t* data,
    size_t len,
    DNSParseResult* result
) {
    if (!data || !result) {
        return Error::InvalidHeader;
    }

    if (len < MIN_DNS_QUERY_SIZE) {
        return Error::PacketTooShort;
    }

    // 解析头部
    result->header = reinterpret_cast<const DNSHeader*>(data);

    // 填充解析结果
    result->id = result->header->getId();
    result->flags = result->header->getFlags();
    result->is_query = result->header->isQuery();
    result->edns_udp_size = 0;

    // 检查是否有问题
    uint16_t qd_count = result->header->getQDCount();
    if (qd_count == 0) {
        return Error::InvalidHeader;
    }

    // 解析第一个问题
    size_t offset = DNS_HEADER_SIZE;
    result->question.name_offset = offset;

    size_t name_end = 0;
    size_t wire_len = 0;
    Error err = parseName(data, len, offset, &name_end, &wire_len);
    if (err != Error::Success) {
        return err;
    }

    // 检查是否有足够空间存储类型和类别
    if (name_end + 4 > len) {
        return Error::TruncatedMessage;
    }

    result->question.qtype = readU16(data + name_end);
    result->question.qclass = readU16(data + name_end + 2);
    result->total_consumed = name_end + 4;
    result->question_end = name_end + 4;  // 问题部分结束位置

    // 跳过其余问题
    offset = result->question_end;
    for (uint16_t i = 1; i < qd_count; i++) {
        err = parseName(data, len, offset, &name_end, &wire_len);
        if (err != Error::Success) {
            return err;
        }
        if (name_end + 4 > len) {
            return Error::TruncatedMessage;
        }
        offset = name_end + 4;
    }

    // 扫描其余记录, 寻找 OPT
    size_t records = static_cast<size_t>(result->header->getANCount()) +
                     result->header->getNSCount() +
                     result->header->getARCount();
    for (size_t i = 0; i < records; i++) {
        CandidateRecord rr;
        err = readRecord(data, len, &offset, &rr);
        if (err != Error::Success) {
            return err;
        }
        if (rr.rrtype == dns_type::OPT) {
            result->edns_udp_size = rr.rrclass;
        }
    }

    return Error::Success;
}

Error DNSParser::parseQuery(
    const uint8_t* data,
    size_t len,
    Query* query
) {
    DNSParseResult parsed;
    Error err = parse(data, len, &parsed);
    if (err != Error::Success) {
        return err;
    }
    if (!parsed.is_query) {
        return Error::NotQuery;
    }
    return toQuery(data, len, parsed, query);
}

Error DNSParser::toQuery(
    const uint8_t* data,
    size_t len,
    const DNSParseResult& parsed,
    Query* query
) {
    if (!query) {
        return Error::InvalidHeader;
    }

    char name_buf[MAX_DOMAIN_LENGTH + 1];
    size_t name_len = 0;
    Error err = decodeName(data, len, parsed.question.name_offset,
                           name_buf, sizeof(name_buf), &name_len);
    if (err != Error::Success) {
        return err;
    }

    query->id = parsed.id;
    query->name.assign(name_buf, name_len);
    query->qtype = parsed.question.qtype;
    query->qclass = parsed.question.qclass;
    query->recursion_desired = parsed.header->isRecursionDesired();
    query->udp_payload_size = parsed.edns_udp_size;
    return Error::Success;
}

Error DNSParser::parseResponse(
    const uint8_t* data,
    size_t len,
    uint16_t expected_id,
    UpstreamResponse* response
) {
    if (!data || !response) {
        return Error::InvalidHeader;
    }

    if (len < DNS_HEADER_SIZE) {
        return Error::PacketTooShort;
    }

    const DNSHeader* hdr = reinterpret_cast<const DNSHeader*>(data);
    if (!hdr->isResponse()) {
        return Error::NotResponse;
    }
    if (hdr->getId() != expected_id) {
        return Error::IdMismatch;
    }

    response->rcode = hdr->getRCode();
    response->truncated = hdr->isTruncated();
    response->records.clear();

    // 跳过问题部分
    size_t offset = DNS_HEADER_SIZE;
    for (uint16_t i = 0; i < hdr->getQDCount(); i++) {
        size_t name_end = 0;
        size_t wire_len = 0;
        Error err = parseName(data, len, offset, &name_end, &wire_len);
        if (err == Error::Success && name_end + 4 > len) {
            err = Error::TruncatedMessage;
        }
        if (err != Error::Success) {
            return response->truncated ? Error::Success : err;
        }
        offset = name_end + 4;
    }

    // 回答部分. 被截断的响应保留已读到的记录
    for (uint16_t i = 0; i < hdr->getANCount(); i++) {
        CandidateRecord rr;
        Error err = readRecord(data, len, &offset, &rr);
        if (err != Error::Success) {
            if (response->truncated) {
                break;
            }
            response->records.clear();
            return err;
        }
        if (rr.rrtype == dns_type::OPT) {
            continue;
        }
        response->records.push_back(std::move(rr));
    }

    return Error::Success;
}

Error DNSParser::parseName(
    const uint8_t* data,
    size_t len,
    size_t offset,
    size_t* end_offset,
    size_t* wire_len
) {
    size_t original_offset = offset;
    bool jumped = false;
    size_t jump_count = 0;
    size_t total_len = 0;

    while (jump_count < MAX_LABELS) {
        if (offset >= len) {
            return Error::TruncatedMessage;
        }

        uint8_t label_len = data[offset];

        // 域名结束
        if (label_len == 0) {
            if (!jumped) {
                *end_offset = offset + 1;
            } else {
                *end_offset = original_offset + 2;
            }
            *wire_len = total_len + 1;  // 包含结束符
            return Error::Success;
        }

        // 压缩指针
        if ((label_len & 0xC0) == 0xC0) {
            if (offset + 1 >= len) {
                return Error::TruncatedMessage;
            }

            uint16_t ptr = ((label_len & 0x3F) << 8) | data[offset + 1];
            if (ptr >= len) {
                return Error::PointerLoop;
            }

            if (!jumped) {
                original_offset = offset;
                jumped = true;
            }

            offset = ptr;
            jump_count++;
            continue;
        }

        // 0x40 / 0x80 为保留的扩展标签类型
        if ((label_len & 0xC0) != 0) {
            return Error::InvalidLabel;
        }

        if (offset + 1 + label_len > len) {
            return Error::TruncatedMessage;
        }

        total_len += 1 + label_len;
        if (total_len + 1 > MAX_DOMAIN_LENGTH) {
            return Error::InvalidLabel;
        }
        offset += 1 + label_len;
    }

    return Error::PointerLoop;
}

Error DNSParser::readNameWire(
    const uint8_t* data,
    size_t len,
    size_t offset,
    size_t* end_offset,
    std::vector<uint8_t>* out
) {
    bool jumped = false;
    size_t jump_count = 0;
    size_t total_len = 0;

    while (jump_count < MAX_LABELS) {
        if (offset >= len) {
            return Error::TruncatedMessage;
        }

        uint8_t label_len = data[offset];

        if (label_len == 0) {
            out->push_back(0);
            if (!jumped) {
                *end_offset = offset + 1;
            }
            return Error::Success;
        }

        if ((label_len & 0xC0) == 0xC0) {
            if (offset + 1 >= len) {
                return Error::TruncatedMessage;
            }
            uint16_t ptr = ((label_len & 0x3F) << 8) | data[offset + 1];
            if (ptr >= len) {
                return Error::PointerLoop;
            }
            if (!jumped) {
                *end_offset = offset + 2;
                jumped = true;
            }
            offset = ptr;
            jump_count++;
            continue;
        }

        if ((label_len & 0xC0) != 0) {
            return Error::InvalidLabel;
        }

        if (offset + 1 + label_len > len) {
            return Error::TruncatedMessage;
        }

        total_len += 1 + label_len;
        if (total_len + 1 > MAX_DOMAIN_LENGTH) {
            return Error::InvalidLabel;
        }

        out->insert(out->end(), data + offset, data + offset + 1 + label_len);
        offset += 1 + label_len;
    }

    return Error::PointerLoop;
}

Error DNSParser::readRecord(
    const uint8_t* data,
    size_t len,
    size_t* offset,
    CandidateRecord* record
) {
    char name_buf[MAX_DOMAIN_LENGTH + 1];
    size_t name_len = 0;
    Error err = decodeName(data, len, *offset, name_buf, sizeof(name_buf), &name_len);
    if (err != Error::Success) {
        return err;
    }

    size_t name_end = 0;
    size_t wire_len = 0;
    err = parseName(data, len, *offset, &name_end, &wire_len);
    if (err != Error::Success) {
        return err;
    }

    // 类型2 + 类别2 + TTL4 + RDLENGTH2
    if (name_end + 10 > len) {
        return Error::TruncatedMessage;
    }

    record->name.assign(name_buf, name_len);
    record->rrtype = readU16(data + name_end);
    record->rrclass = readU16(data + name_end + 2);
    record->ttl = readU32(data + name_end + 4);
    uint16_t rdlen = readU16(data + name_end + 8);

    size_t rdata_offset = name_end + 10;
    if (rdata_offset + rdlen > len) {
        return Error::TruncatedMessage;
    }

    if (record->rrtype == dns_type::A) {
        if (rdlen != 4) {
            return Error::InvalidRecord;
        }
        boost::asio::ip::address_v4::bytes_type bytes;
        std::memcpy(bytes.data(), data + rdata_offset, 4);
        record->address = boost::asio::ip::address_v4(bytes);
    } else if (record->rrtype == dns_type::AAAA) {
        if (rdlen != 16) {
            return Error::InvalidRecord;
        }
        boost::asio::ip::address_v6::bytes_type bytes;
        std::memcpy(bytes.data(), data + rdata_offset, 16);
        record->address = boost::asio::ip::address_v6(bytes);
    }

    record->rdata.clear();
    err = expandRData(data, len, rdata_offset, rdlen, record->rrtype, &record->rdata);
    if (err != Error::Success) {
        return err;
    }

    *offset = rdata_offset + rdlen;
    return Error::Success;
}

Error DNSParser::expandRData(
    const uint8_t* data,
    size_t len,
    size_t rdata_offset,
    size_t rdata_len,
    uint16_t rrtype,
    std::vector<uint8_t>* out
) {
    size_t rdata_end = rdata_offset + rdata_len;
    size_t pos = rdata_offset;
    Error err = Error::Success;

    switch (rrtype) {
        case dns_type::CNAME:
        case dns_type::NS:
        case dns_type::PTR:
        case dns_type::DNAME:
            err = readNameWire(data, len, pos, &pos, out);
            break;

        case dns_type::MX:
            if (rdata_len < 3) {
                return Error::InvalidRecord;
            }
            out->insert(out->end(), data + pos, data + pos + 2);
            err = readNameWire(data, len, pos + 2, &pos, out);
            break;

        case dns_type::SOA:
            // MNAME, RNAME, 然后 5 个 32 位字段
            err = readNameWire(data, len, pos, &pos, out);
            if (err == Error::Success) {
                err = readNameWire(data, len, pos, &pos, out);
            }
            if (err == Error::Success) {
                if (pos + 20 > rdata_end) {
                    return Error::InvalidRecord;
                }
                out->insert(out->end(), data + pos, data + pos + 20);
                pos += 20;
            }
            break;

        default:
            out->insert(out->end(), data + rdata_offset, data + rdata_end);
            return Error::Success;
    }

    if (err != Error::Success) {
        return err;
    }
    if (pos != rdata_end) {
        return Error::InvalidRecord;
    }
    return Error::Success;
}

Error DNSParser::decodeName(
    const uint8_t* packet,
    size_t packet_len,
    size_t name_offset,
    char* out_buf,
    size_t buf_size,
    size_t* out_len
) {
    size_t offset = name_offset;
    size_t buf_pos = 0;
    size_t jump_count = 0;
    bool first_label = true;

    while (jump_count < MAX_LABELS) {
        if (offset >= packet_len) {
            return Error::TruncatedMessage;
        }

        uint8_t label_len = packet[offset];

        if (label_len == 0) {
            if (buf_pos < buf_size) {
                out_buf[buf_pos] = '\0';
            }
            *out_len = buf_pos;
            return Error::Success;
        }

        // 压缩指针
        if ((label_len & 0xC0) == 0xC0) {
            if (offset + 1 >= packet_len) {
                return Error::TruncatedMessage;
            }
            offset = ((label_len & 0x3F) << 8) | packet[offset + 1];
            jump_count++;
            continue;
        }

        if ((label_len & 0xC0) != 0) {
            return Error::InvalidLabel;
        }

        if (offset + 1 + label_len > packet_len) {
            return Error::TruncatedMessage;
        }

        // 添加点分隔符
        if (!first_label) {
            if (buf_pos >= buf_size) {
                return Error::BufferTooSmall;
            }
            out_buf[buf_pos++] = '.';
        }
        first_label = false;

        // 复制标签
        if (buf_pos + label_len > buf_size) {
            return Error::BufferTooSmall;
        }

        offset++;
        for (uint8_t i = 0; i < label_len; i++) {
            out_buf[buf_pos++] = static_cast<char>(std::tolower(packet[offset + i]));
        }
        offset += label_len;
    }

    return Error::PointerLoop;
}

// ==================== DNS Response Builder ====================

size_t DNSResponseBuilder::payloadLimit(const Query& query) {
    if (query.udp_payload_size == 0) {
        return CLASSIC_UDP_SIZE;
    }
    size_t limit = query.udp_payload_size;
    if (limit < CLASSIC_UDP_SIZE) limit = CLASSIC_UDP_SIZE;
    if (limit > MAX_UDP_PACKET_SIZE) limit = MAX_UDP_PACKET_SIZE;
    return limit;
}

void DNSResponseBuilder::writeName(std::vector<uint8_t>* out, const std::string& name) {
    size_t start = 0;
    while (start < name.size()) {
        size_t dot = name.find('.', start);
        if (dot == std::string::npos) dot = name.size();
        size_t label_len = dot - start;
        if (label_len > MAX_LABEL_LENGTH) label_len = MAX_LABEL_LENGTH;
        if (label_len > 0) {
            out->push_back(static_cast<uint8_t>(label_len));
            out->insert(out->end(), name.begin() + start, name.begin() + start + label_len);
        }
        start = dot + 1;
    }
    out->push_back(0);
}

std::vector<uint8_t> DNSResponseBuilder::buildQuery(const Query& query) {
    std::vector<uint8_t> out;
    out.reserve(DNS_HEADER_SIZE + query.name.size() + 2 + 4 + OPT_RECORD_SIZE);

    putU16(&out, query.id);
    putU16(&out, query.recursion_desired ? 0x0100 : 0x0000);
    putU16(&out, 1);    // QDCOUNT
    putU16(&out, 0);
    putU16(&out, 0);
    putU16(&out, 1);    // ARCOUNT: OPT

    writeName(&out, query.name);
    putU16(&out, query.qtype);
    putU16(&out, query.qclass);

    // 向上游声明与接收缓冲区一致的 UDP 大小
    out.push_back(0);
    putU16(&out, dns_type::OPT);
    putU16(&out, static_cast<uint16_t>(MAX_UDP_PACKET_SIZE));
    putU32(&out, 0);
    putU16(&out, 0);

    return out;
}

std::vector<uint8_t> DNSResponseBuilder::buildResponse(
    const Query& query,
    const ResolvedAnswer& answer
) {
    std::vector<uint8_t> out;
    out.reserve(CLASSIC_UDP_SIZE);

    putU16(&out, query.id);
    putU16(&out, 0);    // flags, 最后填写
    putU16(&out, 1);
    putU16(&out, 0);    // ANCOUNT, 最后填写
    putU16(&out, 0);
    putU16(&out, 0);

    writeName(&out, query.name);
    putU16(&out, query.qtype);
    putU16(&out, query.qclass);

    size_t limit = payloadLimit(query);
    bool has_opt = query.udp_payload_size != 0;
    if (has_opt) {
        limit -= OPT_RECORD_SIZE;
    }

    uint16_t an_count = 0;
    bool truncated = false;
    for (const auto& rr : answer.records) {
        size_t mark = out.size();

        // 与问题同名时使用指向问题的压缩指针
        if (rr.name == query.name) {
            out.push_back(0xC0);
            out.push_back(static_cast<uint8_t>(DNS_HEADER_SIZE));
        } else {
            writeName(&out, rr.name);
        }
        putU16(&out, rr.rrtype);
        putU16(&out, rr.rrclass);
        putU32(&out, rr.ttl);
        putU16(&out, static_cast<uint16_t>(rr.rdata.size()));
        out.insert(out.end(), rr.rdata.begin(), rr.rdata.end());

        if (out.size() > limit) {
            out.resize(mark);
            truncated = true;
            break;
        }
        an_count++;
    }

    uint16_t flags = 0x8000 | 0x0080;   // QR = 1, RA = 1
    if (query.recursion_desired) flags |= 0x0100;
    if (truncated) flags |= 0x0200;
    flags |= answer.rcode & 0x0F;
    patchU16(&out, 2, flags);
    patchU16(&out, 6, an_count);

    if (has_opt) {
        out.push_back(0);
        putU16(&out, dns_type::OPT);
        putU16(&out, static_cast<uint16_t>(MAX_UDP_PACKET_SIZE));
        putU32(&out, 0);
        putU16(&out, 0);
        patchU16(&out, 10, 1);
    }

    return out;
}

size_t DNSResponseBuilder::buildError(
    const uint8_t* query,
    size_t query_len,
    const DNSParseResult& parsed,
    uint8_t rcode,
    uint8_t* response,
    size_t response_buf_size
) {
    if (parsed.total_consumed > query_len || response_buf_size < parsed.total_consumed) {
        return 0;
    }

    std::memcpy(response, query, parsed.total_consumed);

    DNSHeader* hdr = reinterpret_cast<DNSHeader*>(response);
    uint16_t flags = parsed.header->getFlags();
    flags |= 0x8000;  // QR = 1
    flags |= 0x0080;  // RA = 1
    flags &= ~0x0600; // AA = 0, TC = 0
    flags &= 0xFFF0;
    flags |= rcode & 0x0F;
    hdr->flags = htons(flags);

    hdr->qd_count = htons(1);
    hdr->an_count = 0;
    hdr->ns_count = 0;
    hdr->ar_count = 0;

    return parsed.total_consumed;
}

size_t DNSResponseBuilder::buildHeaderError(
    const uint8_t* query,
    size_t query_len,
    uint8_t rcode,
    uint8_t* response,
    size_t response_buf_size
) {
    if (query_len < DNS_HEADER_SIZE || response_buf_size < DNS_HEADER_SIZE) {
        return 0;
    }

    std::memcpy(response, query, DNS_HEADER_SIZE);

    DNSHeader* hdr = reinterpret_cast<DNSHeader*>(response);
    uint16_t flags = hdr->getFlags();
    flags |= 0x8000;
    flags |= 0x0080;
    flags &= ~0x0600;
    flags &= 0xFFF0;
    flags |= rcode & 0x0F;
    hdr->flags = htons(flags);

    hdr->qd_count = 0;
    hdr->an_count = 0;
    hdr->ns_count = 0;
    hdr->ar_count = 0;

    return DNS_HEADER_SIZE;
}

} // namespace pomelo
